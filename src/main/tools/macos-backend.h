/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_MACOS_BACKEND_H_
#define SRC_MAIN_TOOLS_MACOS_BACKEND_H_

#if defined(__APPLE__)

#include <string>

#include "src/main/tools/platform-backend.h"

namespace tinycage {

// Confines the child with a Seatbelt profile synthesized from the policy.
// There are no namespaces, so the target keeps the host's view of the
// filesystem and the child execs it directly.
class MacosBackend : public PlatformBackend {
 public:
  MacosBackend() {}

  const char* Name() const override { return "macos-seatbelt"; }
  int Prepare(const ResolvedPolicy& policy, const std::string& working_dir,
              bool explicit_working_dir) override;
  pid_t CreateChild(int (*child_main)(void *), void *arg) override;
  int Apply(StatusRecord *failure) override;
  int RestrictTarget(StatusRecord *) override { return 0; }
  bool RunsAsInit() const override { return false; }

  const std::string& profile() const { return profile_; }

 private:
  std::string profile_;
  std::string working_dir_;
  bool explicit_working_dir_ = false;
};

}  // namespace tinycage

#endif  // defined(__APPLE__)

#endif  // SRC_MAIN_TOOLS_MACOS_BACKEND_H_
