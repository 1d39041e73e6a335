/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#if defined(__APPLE__)

#include "src/main/tools/macos-backend.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/macos-profile.h"

#include <errno.h>
#include <unistd.h>

extern "C" {
#include <sandbox.h>
}

namespace tinycage {

int MacosBackend::Prepare(const ResolvedPolicy &policy, const std::string &working_dir,
                          bool explicit_working_dir) {
  std::vector<SymlinkAlias> aliases = policy.aliases();
  std::vector<PolicyEntry> entries = CollectEnforceableEntries(policy, &aliases);
  profile_ = SynthesizeProfile(entries, aliases, policy.network_allowed());
  working_dir_ = working_dir;
  explicit_working_dir_ = explicit_working_dir;
  PRINT_DEBUG("seatbelt profile:\n%s", profile_.c_str());
  return 0;
}


pid_t MacosBackend::CreateChild(int (*child_main)(void *), void *arg) {
  pid_t pid = fork();
  if (pid == 0) {
    _exit(child_main(arg));
  }
  return pid;
}


int MacosBackend::Apply(StatusRecord *failure) {
  // The profile may not grant the working directory, so enter it first.
  if (!working_dir_.empty() && chdir(working_dir_.c_str()) < 0) {
    if (explicit_working_dir_) {
      FillStatusRecord(failure, STAGE_WORKING_DIR_FAILED, errno, "chdir",
                       working_dir_.c_str());
      return -1;
    }
    if (chdir("/") < 0) {
      FillStatusRecord(failure, STAGE_POLICY_FAILED, errno, "chdir", "/");
      return -1;
    }
  }

  char *error = nullptr;
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
  int res = ::sandbox_init(profile_.c_str(), 0, &error);
#pragma clang diagnostic pop
  if (res != 0) {
    FillStatusRecord(failure, STAGE_POLICY_FAILED, EPERM, "sandbox_init", error);
    if (error != nullptr) {
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
      ::sandbox_free_error(error);
#pragma clang diagnostic pop
    }
    return -1;
  }
  return 0;
}

}  // namespace tinycage

#endif  // defined(__APPLE__)
