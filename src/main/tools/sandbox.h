/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_SANDBOX_H_
#define SRC_MAIN_TOOLS_SANDBOX_H_

#include <string>
#include <vector>

#include "src/main/tools/child.h"
#include "src/main/tools/command.h"
#include "src/main/tools/exception.h"
#include "src/main/tools/policy.h"
#include "src/main/tools/spawn-state.h"

namespace tinycage {

// Accumulates exceptions and launches confined children. Nothing is granted
// unless an exception says so. A Sandbox can launch any number of children;
// each spawn resolves the exceptions again against the filesystem as it is
// at that moment.
class Sandbox {
 public:
  Sandbox();

  // Returns 0, or reports Conflict for a second custom environment and
  // InvalidException for a path that names nothing.
  int AddException(const Exception& exception);

  // Starts `command` in the sandbox. Returns 0 with `child` set once the
  // program runs confined, -1 with the last error set otherwise.
  int Spawn(const Command& command, Child* child);

  // Resolves the current exceptions the way Spawn() would.
  int ResolvePolicy(ResolvedPolicy* policy);

  void SetImplicitLibraryReads(bool enabled) { implicit_library_reads_ = enabled; }
  bool implicit_library_reads() const { return implicit_library_reads_; }

  // Linux only. Host directory the child mounts its private root over.
  void SetStagingDirectory(const std::string& dir) { staging_dir_ = dir; }

  const std::vector<Exception>& exceptions() const { return exceptions_; }
  const std::vector<ResolutionWarning>& LastWarnings() const { return last_warnings_; }
  // State the last Spawn() ended in.
  SpawnState LastSpawnState() const { return last_state_; }

 private:
  int Resolve(const std::string& cwd, ResolvedPolicy* policy);
  std::string SearchPath() const;

  std::vector<Exception> exceptions_;
  bool implicit_library_reads_;
  std::string staging_dir_;
  std::vector<ResolutionWarning> last_warnings_;
  SpawnState last_state_;
};

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_SANDBOX_H_
