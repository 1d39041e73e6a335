// Copyright 2016 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_MAIN_TOOLS_LINUX_BACKEND_H_
#define SRC_MAIN_TOOLS_LINUX_BACKEND_H_

#if defined(__linux__)

#include <string>
#include <vector>

#include "src/main/tools/platform-backend.h"

namespace tinycage {

// One mount operation of the child, with every path already prefixed by the
// staging directory.
struct LinuxMount {
  enum Kind {
    // Recursive bind of `source` onto `target`, then a remount with `flags`.
    BIND,
    // Remount of a submount that the recursive bind of an entry carried along.
    REMOUNT,
  };
  Kind kind;
  std::string source;
  std::string target;
  bool is_directory;
  unsigned long flags;
  // Directories to create before `target`, outermost first.
  std::vector<std::string> parents;
  // Copy of the staging directory inside this bind, detached right after it.
  std::string hide;
};

struct LinuxSymlink {
  std::string target;
  std::string link;
  std::vector<std::string> parents;
};

// Everything the child does, computed by the parent so that the child only
// issues system calls.
struct LinuxMountPlan {
  std::string staging_dir;
  std::vector<LinuxMount> mounts;
  std::vector<LinuxSymlink> symlinks;
  // Device nodes bound into <staging>/dev, host paths.
  std::vector<std::string> dev_nodes;
  std::vector<std::string> dev_targets;
  bool minimal_dev = true;
  std::string dev_dir;
  std::string proc_dir;
  // The new root stays writable when "/" itself was granted write access.
  bool remount_root_readonly = true;
  bool network_isolated = true;
  std::string uid_map;
  std::string gid_map;
  std::string working_dir;
  bool explicit_working_dir = false;
};

// Flags for the remount following a bind of `source` granted `access`. Keeps
// the flags the host mount already has, because the kernel refuses to clear
// them inside a user namespace.
unsigned long RemountFlagsFor(const std::string& source, unsigned access);

// Runs the target in fresh user, mount, PID and IPC namespaces, plus a network
// namespace unless networking was granted, with a root filesystem that only
// contains the granted paths.
class LinuxBackend : public PlatformBackend {
 public:
  explicit LinuxBackend(const std::string& staging_dir);

  const char* Name() const override { return "linux-namespaces"; }
  int Prepare(const ResolvedPolicy& policy, const std::string& working_dir,
              bool explicit_working_dir) override;
  pid_t CreateChild(int (*child_main)(void *), void *arg) override;
  int Apply(StatusRecord *failure) override;
  int RestrictTarget(StatusRecord *failure) override;
  bool RunsAsInit() const override { return true; }

  const LinuxMountPlan& plan() const { return plan_; }

  // Builds the plan without checking for namespace support or touching the
  // staging directory.
  void BuildPlan(const ResolvedPolicy& policy, const std::string& working_dir,
                 bool explicit_working_dir);

 private:
  int PrepareStagingDirectory();

  std::string staging_dir_;
  LinuxMountPlan plan_;
};

}  // namespace tinycage

#endif  // defined(__linux__)

#endif  // SRC_MAIN_TOOLS_LINUX_BACKEND_H_
