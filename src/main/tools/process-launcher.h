/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_PROCESS_LAUNCHER_H_
#define SRC_MAIN_TOOLS_PROCESS_LAUNCHER_H_

#include <string>
#include <vector>

#include "src/main/tools/child.h"
#include "src/main/tools/command.h"
#include "src/main/tools/platform-backend.h"
#include "src/main/tools/spawn-state.h"

namespace tinycage {

struct SpawnRequest {
  // Canonical host path handed to execve().
  std::string program;
  // Full argument vector, argv[0] included.
  std::vector<std::string> argv;
  // "NAME=VALUE" strings.
  std::vector<std::string> env;
  std::string working_dir;
  // The caller asked for `working_dir`, so failing to enter it is fatal.
  bool explicit_working_dir = false;
  Stdio stdin_mode = Stdio::Inherit;
  Stdio stdout_mode = Stdio::Inherit;
  Stdio stderr_mode = Stdio::Inherit;
};

// Environment of the target: exactly the custom environment when the policy
// has one, a copy of the caller's environment otherwise.
std::vector<std::string> BuildEnvironment(const ResolvedPolicy& policy);

// Runs `request` under `policy` enforced by `backend`. Returns 0 once the
// target image replaced the child, with `child` holding the handle.
// Otherwise reports the error, leaves no process behind and returns -1.
// `final_state` receives the last state of the spawn when not null.
int LaunchProcess(PlatformBackend* backend, const ResolvedPolicy& policy,
                  const SpawnRequest& request, Child* child, SpawnState* final_state);

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_PROCESS_LAUNCHER_H_
