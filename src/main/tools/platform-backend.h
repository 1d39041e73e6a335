/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_PLATFORM_BACKEND_H_
#define SRC_MAIN_TOOLS_PLATFORM_BACKEND_H_

#include <sys/types.h>

#include <memory>
#include <string>
#include <vector>

#include "src/main/tools/policy.h"
#include "src/main/tools/spawn-state.h"

namespace tinycage {

struct BackendOptions {
  // Host directory the Linux child mounts its private root over. Empty means
  // /tmp/tinycage-<uid>.
  std::string staging_dir;
};

// OS specific enforcement of a ResolvedPolicy. One instance serves one spawn.
//
// The parent calls Prepare() and then CreateChild(). The child created that
// way calls Apply() and RestrictTarget() before anything else runs in it;
// both must limit themselves to system calls on data prepared by Prepare().
class PlatformBackend {
 public:
  virtual ~PlatformBackend() {}

  virtual const char* Name() const = 0;

  // Parent side. Checks that the mechanism is usable, re-probes pending
  // entries and precomputes everything the child needs.
  virtual int Prepare(const ResolvedPolicy& policy, const std::string& working_dir,
                      bool explicit_working_dir) = 0;

  // Parent side. Starts `child_main(arg)` in a new process and returns its
  // pid, or -1 with errno set.
  virtual pid_t CreateChild(int (*child_main)(void *), void *arg) = 0;

  // Child side. Installs the policy and enters the working directory. On
  // failure fills `failure` and returns -1.
  virtual int Apply(StatusRecord *failure) = 0;

  // Child side. Gives up whatever could be used to widen the sandbox again.
  virtual int RestrictTarget(StatusRecord *failure) = 0;

  // True when the process from CreateChild() must stay alive as the init of a
  // PID namespace and run the target as its own child.
  virtual bool RunsAsInit() const = 0;
};

// Backend for the operating system this library was built for, or nullptr if
// there is none.
std::unique_ptr<PlatformBackend> CreatePlatformBackend(const BackendOptions &options);

// Entries that can be enforced right now: pending entries whose path appeared
// since resolution are canonicalized again, the ones still missing are left
// out. Symlinks crossed while doing so are appended to `aliases`.
std::vector<PolicyEntry> CollectEnforceableEntries(const ResolvedPolicy &policy,
                                                   std::vector<SymlinkAlias> *aliases);

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_PLATFORM_BACKEND_H_
