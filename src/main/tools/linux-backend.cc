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

/**
 * Everything after clone() in here runs as PID 1 of the new namespaces, before
 * the target exists. It must not allocate: glibc's clone() wrapper does not
 * run the atfork handlers, so the malloc arena may be in any state.
 */

#if defined(__linux__)

#include "src/main/tools/linux-backend.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <fcntl.h>
#include <mntent.h>
#include <sched.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#ifndef MS_REC
// Some systems do not define MS_REC in sys/mount.h. We might be able to grab it
// from linux/fs.h instead (cf. #2667).
#include <linux/fs.h>
#endif

#include <linux/capability.h>

#include <string>
#include <vector>

#define CAP_VERSION _LINUX_CAPABILITY_VERSION_3
#define CAP_WORDS _LINUX_CAPABILITY_U32S_3

namespace tinycage {

static const char *const kDevNodes[] = {
    "/dev/null", "/dev/zero", "/dev/full", "/dev/random", "/dev/urandom",
};

static const char *const kDevLinks[][2] = {
    {"/proc/self/fd", "/dev/fd"},
    {"/proc/self/fd/0", "/dev/stdin"},
    {"/proc/self/fd/1", "/dev/stdout"},
    {"/proc/self/fd/2", "/dev/stderr"},
};


unsigned long RemountFlagsFor(const std::string &source, unsigned access) {
  unsigned long flags = MS_BIND | MS_REMOUNT | MS_NOSUID;
  if (!(access & ACCESS_WRITE)) {
    flags |= MS_RDONLY;
  }
  if (!(access & ACCESS_EXECUTE)) {
    flags |= MS_NOEXEC;
  }

  struct statvfs vfs;
  if (statvfs(source.c_str(), &vfs) == 0) {
    if (vfs.f_flag & ST_RDONLY) {
      flags |= MS_RDONLY;
    }
    if (vfs.f_flag & ST_NODEV) {
      flags |= MS_NODEV;
    }
    if (vfs.f_flag & ST_NOEXEC) {
      flags |= MS_NOEXEC;
    }
    if (vfs.f_flag & ST_NOATIME) {
      flags |= MS_NOATIME;
    }
    if (vfs.f_flag & ST_NODIRATIME) {
      flags |= MS_NODIRATIME;
    }
    if (vfs.f_flag & ST_RELATIME) {
      flags |= MS_RELATIME;
    }
  } else {
    PRINT_DEBUG("statvfs(%s) failed: %s", source.c_str(), strerror(errno));
  }
  return flags;
}


static std::vector<std::string> ReadMountPoints() {
  std::vector<std::string> res;
  FILE *mounts = setmntent("/proc/self/mounts", "r");
  if (mounts == nullptr) {
    PRINT_DEBUG("setmntent(/proc/self/mounts) failed: %s", strerror(errno));
    return res;
  }
  struct mntent *ent;
  while ((ent = getmntent(mounts)) != nullptr) {
    res.push_back(NormalizePath(ent->mnt_dir));
  }
  endmntent(mounts);
  return res;
}


LinuxBackend::LinuxBackend(const std::string &staging_dir) : staging_dir_(staging_dir) {}


int LinuxBackend::PrepareStagingDirectory() {
  if (staging_dir_.empty()) {
    const std::string path = "/tmp/tinycage-" + std::to_string(getuid());
    if (mkdir(path.c_str(), 0700) < 0 && errno != EEXIST) {
      return TinyCageReportOSError("mkdir " + path, ErrorCode::ProcessCreation, errno);
    }
    struct stat sb;
    if (lstat(path.c_str(), &sb) < 0) {
      return TinyCageReportOSError("lstat " + path, ErrorCode::ProcessCreation, errno);
    }
    // Someone else could have planted a symlink or a directory of their own.
    if (!S_ISDIR(sb.st_mode) || sb.st_uid != getuid()) {
      return TinyCageReportOSError(path + " is not a directory owned by us",
                                   ErrorCode::ProcessCreation, EPERM);
    }
    staging_dir_ = path;
    return 0;
  }

  PathResolver resolver("/");
  ResolvedPath resolved = resolver.Resolve(staging_dir_);
  if (!resolved.exists) {
    return TinyCageReportOSError("staging directory " + staging_dir_,
                                 ErrorCode::ProcessCreation, resolved.error);
  }
  if (!resolved.is_directory) {
    return TinyCageReportOSError("staging directory " + staging_dir_,
                                 ErrorCode::ProcessCreation, ENOTDIR);
  }
  staging_dir_ = resolved.path;
  return 0;
}


void LinuxBackend::BuildPlan(const ResolvedPolicy &policy, const std::string &working_dir,
                             bool explicit_working_dir) {
  plan_ = LinuxMountPlan();
  plan_.staging_dir = staging_dir_;
  const std::string staging = staging_dir_;
  auto staged = [&staging](const std::string &path) {
    return path == "/" ? staging : staging + path;
  };
  auto staged_parents = [&staged](const std::string &path) {
    std::vector<std::string> res;
    for (const std::string &ancestor : PathAncestors(path)) {
      if (ancestor != "/") res.push_back(staged(ancestor));
    }
    return res;
  };

  char buf[64];
  snprintf(buf, sizeof(buf), "%u %u 1\n", static_cast<unsigned>(getuid()),
           static_cast<unsigned>(getuid()));
  plan_.uid_map = buf;
  snprintf(buf, sizeof(buf), "%u %u 1\n", static_cast<unsigned>(getgid()),
           static_cast<unsigned>(getgid()));
  plan_.gid_map = buf;

  std::vector<SymlinkAlias> aliases = policy.aliases();
  std::vector<PolicyEntry> entries = CollectEnforceableEntries(policy, &aliases);
  std::vector<std::string> mount_points = ReadMountPoints();

  auto governing = [&entries](const std::string &path) -> const PolicyEntry * {
    const PolicyEntry *best = nullptr;
    for (const PolicyEntry &entry : entries) {
      if ((entry.path == path || (entry.is_directory && IsPathPrefix(entry.path, path))) &&
          (best == nullptr || entry.path.size() > best->path.size())) {
        best = &entry;
      }
    }
    return best;
  };

  for (const PolicyEntry &entry : entries) {
    LinuxMount bind;
    bind.kind = LinuxMount::BIND;
    bind.source = entry.path;
    bind.target = staged(entry.path);
    bind.is_directory = entry.is_directory;
    bind.flags = RemountFlagsFor(entry.path, entry.access);
    bind.parents = staged_parents(entry.path);
    if (entry.is_directory && IsPathPrefix(entry.path, staging)) {
      bind.hide = staged(staging);
    }
    PRINT_DEBUG("bind %s %s flags=0x%lx", AccessToString(entry.access).c_str(),
                entry.path.c_str(), bind.flags);
    plan_.mounts.push_back(bind);

    if (entry.path == "/") {
      plan_.remount_root_readonly = false;
    }
    if (!entry.is_directory) {
      continue;
    }

    for (const std::string &mount_point : mount_points) {
      if (mount_point == entry.path || !IsPathPrefix(entry.path, mount_point) ||
          IsPathPrefix(staging, mount_point) || governing(mount_point) != &entry) {
        continue;
      }
      LinuxMount submount;
      submount.kind = LinuxMount::REMOUNT;
      submount.source = mount_point;
      submount.target = staged(mount_point);
      submount.is_directory = true;
      submount.flags = RemountFlagsFor(mount_point, entry.access);
      PRINT_DEBUG("submount %s under %s flags=0x%lx", mount_point.c_str(), entry.path.c_str(),
                  submount.flags);
      plan_.mounts.push_back(submount);
    }
  }

  const PolicyEntry *dev_entry = governing("/dev");
  plan_.minimal_dev = (dev_entry == nullptr);
  plan_.dev_dir = staged("/dev");
  plan_.proc_dir = staged("/proc");

  for (const SymlinkAlias &alias : aliases) {
    const PolicyEntry *owner = governing(alias.link);
    if (owner != nullptr || IsPathPrefix("/proc", alias.link) ||
        (plan_.minimal_dev && IsPathPrefix("/dev", alias.link))) {
      continue;
    }
    LinuxSymlink link;
    link.target = alias.target;
    link.link = staged(alias.link);
    link.parents = staged_parents(alias.link);
    PRINT_DEBUG("symlink %s -> %s", alias.link.c_str(), alias.target.c_str());
    plan_.symlinks.push_back(link);
  }

  if (plan_.minimal_dev) {
    for (const char *node : kDevNodes) {
      struct stat sb;
      if (stat(node, &sb) < 0 || governing(node) != nullptr) {
        continue;
      }
      plan_.dev_nodes.push_back(node);
      plan_.dev_targets.push_back(staged(node));
    }
    for (const auto &dev_link : kDevLinks) {
      LinuxSymlink link;
      link.target = dev_link[0];
      link.link = staged(dev_link[1]);
      link.parents = staged_parents(dev_link[1]);
      plan_.symlinks.push_back(link);
    }
  }

  plan_.network_isolated = !policy.network_allowed();
  plan_.working_dir = working_dir;
  plan_.explicit_working_dir = explicit_working_dir;
}


int LinuxBackend::Prepare(const ResolvedPolicy &policy, const std::string &working_dir,
                          bool explicit_working_dir) {
  if (!UserNamespaceSupported()) {
    return TinyCageReportOSError("unprivileged user namespaces are unavailable",
                                 ErrorCode::NotSupported, ENOTSUP);
  }
  int res = PrepareStagingDirectory();
  if (res < 0) {
    return res;
  }
  BuildPlan(policy, working_dir, explicit_working_dir);
  PRINT_DEBUG("linux plan: %zu mounts, %zu symlinks, staging %s, network %s",
              plan_.mounts.size(), plan_.symlinks.size(), plan_.staging_dir.c_str(),
              plan_.network_isolated ? "isolated" : "shared");
  return 0;
}


pid_t LinuxBackend::CreateChild(int (*child_main)(void *), void *arg) {
  const int kStackSize = 1024 * 1024;
  std::vector<char> child_stack(kStackSize);

  int clone_flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWPID | SIGCHLD;
  if (plan_.network_isolated) {
    clone_flags |= CLONE_NEWNET;
  }

  // We use clone instead of unshare, because unshare sometimes fails with
  // EINVAL due to a race condition in the Linux kernel (see
  // https://lkml.org/lkml/2015/7/28/833).
  PRINT_DEBUG("calling clone(2) with flags 0x%x...", clone_flags);
  return clone(child_main, child_stack.data() + kStackSize, clone_flags, arg);
}


// Child side helpers. None of them allocates.

static int Fail(StatusRecord *failure, const char *what, const char *path) {
  FillStatusRecord(failure, STAGE_POLICY_FAILED, errno, what, path);
  return -1;
}


// Creates the file or directory `path` unless it exists with the right type.
// Returns -1 and sets errno to ENOTDIR or EEXIST on a type mismatch.
static int CreateTarget(const char *path, bool is_directory) {
  struct stat sb;
  if (stat(path, &sb) == 0) {
    if (is_directory == S_ISDIR(sb.st_mode)) {
      return 0;
    }
    errno = is_directory ? ENOTDIR : EEXIST;
    return -1;
  }
  if (errno != ENOENT) {
    return -1;
  }

  if (is_directory) {
    if (mkdir(path, 0755) < 0 && errno != EEXIST) {
      return -1;
    }
    return 0;
  }

  int handle = open(path, O_CREAT | O_WRONLY | O_EXCL | O_CLOEXEC, 0644);
  if (handle < 0) {
    return errno == EEXIST ? 0 : -1;
  }
  close(handle);
  return 0;
}


static int CreateParents(const std::vector<std::string> &parents, StatusRecord *failure) {
  for (const std::string &dir : parents) {
    if (CreateTarget(dir.c_str(), true) < 0) {
      return Fail(failure, "mkdir", dir.c_str());
    }
  }
  return 0;
}


static int SetupUserNamespace(const LinuxMountPlan &plan, StatusRecord *failure) {
  // Disable needs for CAP_SETGID.
  struct stat sb;
  if (stat("/proc/self/setgroups", &sb) == 0) {
    if (WriteFile("/proc/self/setgroups", "deny") < 0) {
      return Fail(failure, "write", "/proc/self/setgroups");
    }
  } else if (errno != ENOENT) {
    // Older kernels do not have this file and do not need it.
    return Fail(failure, "stat", "/proc/self/setgroups");
  }

  if (WriteFile("/proc/self/uid_map", plan.uid_map.c_str()) < 0) {
    return Fail(failure, "write", "/proc/self/uid_map");
  }
  if (WriteFile("/proc/self/gid_map", plan.gid_map.c_str()) < 0) {
    return Fail(failure, "write", "/proc/self/gid_map");
  }
  return 0;
}


static int MountEntries(const LinuxMountPlan &plan, StatusRecord *failure) {
  for (const LinuxMount &m : plan.mounts) {
    if (m.kind == LinuxMount::REMOUNT) {
      if (mount(nullptr, m.target.c_str(), nullptr, m.flags, nullptr) < 0 &&
          errno != ENOENT && errno != ESTALE && errno != EINVAL) {
        return Fail(failure, "remount submount", m.target.c_str());
      }
      continue;
    }

    if (CreateParents(m.parents, failure) < 0) {
      return -1;
    }
    if (CreateTarget(m.target.c_str(), m.is_directory) < 0) {
      return Fail(failure, "create mount point", m.target.c_str());
    }
    if (mount(m.source.c_str(), m.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) < 0) {
      return Fail(failure, "bind mount", m.source.c_str());
    }
    if (!m.hide.empty() && umount2(m.hide.c_str(), MNT_DETACH) < 0 &&
        errno != EINVAL && errno != ENOENT) {
      return Fail(failure, "umount", m.hide.c_str());
    }
    if (mount(nullptr, m.target.c_str(), nullptr, m.flags, nullptr) < 0) {
      return Fail(failure, "remount", m.source.c_str());
    }
  }
  return 0;
}


static int MountDev(const LinuxMountPlan &plan, StatusRecord *failure) {
  if (!plan.minimal_dev) {
    return 0;
  }
  if (CreateTarget(plan.dev_dir.c_str(), true) < 0) {
    return Fail(failure, "mkdir", plan.dev_dir.c_str());
  }
  for (size_t i = 0; i < plan.dev_nodes.size(); i++) {
    if (CreateTarget(plan.dev_targets[i].c_str(), false) < 0) {
      return Fail(failure, "create", plan.dev_targets[i].c_str());
    }
    if (mount(plan.dev_nodes[i].c_str(), plan.dev_targets[i].c_str(), nullptr, MS_BIND,
              nullptr) < 0) {
      return Fail(failure, "bind mount", plan.dev_nodes[i].c_str());
    }
  }
  return 0;
}


static int CreateSymlinks(const LinuxMountPlan &plan, StatusRecord *failure) {
  for (const LinuxSymlink &link : plan.symlinks) {
    if (CreateParents(link.parents, failure) < 0) {
      return -1;
    }
    if (symlink(link.target.c_str(), link.link.c_str()) < 0 && errno != EEXIST) {
      return Fail(failure, "symlink", link.link.c_str());
    }
  }
  return 0;
}


static int MountProc(const LinuxMountPlan &plan, StatusRecord *failure) {
  if (CreateTarget(plan.proc_dir.c_str(), true) < 0) {
    return Fail(failure, "mkdir", plan.proc_dir.c_str());
  }
  // Only a fresh proc hides the host's processes. The kernel refuses it where
  // the host proc is partially masked, e.g. inside most containers, and then
  // the spawn fails.
  if (mount("proc", plan.proc_dir.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
            nullptr) < 0) {
    return Fail(failure, "mount proc", plan.proc_dir.c_str());
  }
  return 0;
}


static int ChangeRoot(const LinuxMountPlan &plan, StatusRecord *failure) {
  int old_root_fd = open("/", O_DIRECTORY | O_PATH | O_CLOEXEC);
  if (old_root_fd < 0) {
    return Fail(failure, "open", "/");
  }
  int new_root_fd = open(plan.staging_dir.c_str(), O_DIRECTORY | O_PATH | O_CLOEXEC);
  if (new_root_fd < 0) {
    Fail(failure, "open", plan.staging_dir.c_str());
    close(old_root_fd);
    return -1;
  }

  int res = -1;
  if (fchdir(new_root_fd) < 0) {
    Fail(failure, "fchdir", plan.staging_dir.c_str());
  } else if (syscall(SYS_pivot_root, ".", ".") < 0) {
    // pivot_root has no wrapper in libc, so we need syscall()
    Fail(failure, "pivot_root", plan.staging_dir.c_str());
  } else if (fchdir(old_root_fd) < 0) {
    Fail(failure, "fchdir", "old root");
  } else if (mount(nullptr, ".", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
    Fail(failure, "make private", "old root");
  } else if (umount2(".", MNT_DETACH) < 0) {
    Fail(failure, "umount2", "old root");
  } else {
    res = 0;
    // The old root can be stacked more than once.
    while (umount2(".", MNT_DETACH) == 0) {
    }
    if (errno != EINVAL) {
      res = Fail(failure, "umount2", "old root");
    } else if (chdir("/") < 0) {
      res = Fail(failure, "chdir", "/");
    }
  }
  close(old_root_fd);
  close(new_root_fd);
  return res;
}


static int EnterWorkingDirectory(const LinuxMountPlan &plan, StatusRecord *failure) {
  if (plan.working_dir.empty() || chdir(plan.working_dir.c_str()) == 0) {
    return 0;
  }
  if (plan.explicit_working_dir) {
    FillStatusRecord(failure, STAGE_WORKING_DIR_FAILED, errno, "chdir",
                     plan.working_dir.c_str());
    return -1;
  }
  // The inherited working directory is not part of the sandbox.
  if (chdir("/") < 0) {
    return Fail(failure, "chdir", "/");
  }
  return 0;
}


int LinuxBackend::Apply(StatusRecord *failure) {
  const LinuxMountPlan &plan = plan_;

  // Isolate only mounts in the slave (us) but not mounts in the master.
  // This is needed to support autofs
  if (mount(nullptr, "/", nullptr, MS_REC | MS_SLAVE, nullptr) < 0) {
    return Fail(failure, "mount", "/");
  }
  if (SetupUserNamespace(plan, failure) < 0) {
    return -1;
  }
  if (mount("tmpfs", plan.staging_dir.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
            "mode=0755") < 0) {
    return Fail(failure, "mount tmpfs", plan.staging_dir.c_str());
  }

  if (MountEntries(plan, failure) < 0 || CreateSymlinks(plan, failure) < 0 ||
      MountDev(plan, failure) < 0 || MountProc(plan, failure) < 0 ||
      ChangeRoot(plan, failure) < 0) {
    return -1;
  }

  if (plan.remount_root_readonly &&
      mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV,
            nullptr) < 0) {
    return Fail(failure, "remount read-only", "/");
  }

  // A new network namespace starts with its loopback interface down, which is
  // how it stays.
  return EnterWorkingDirectory(plan, failure);
}


static int drop_caps_ep_except(uint64_t keep) {
  struct __user_cap_header_struct hdr = {
    .version = CAP_VERSION,
    .pid = 0,
  };
  struct __user_cap_data_struct data[CAP_WORDS];
  int i;

  if (syscall(SYS_capget, &hdr, data))
    return -1;

  for (i = 0; i < CAP_WORDS; i++) {
    uint32_t mask = keep >> (32 * i);

    data[i].effective &= mask;
    data[i].permitted &= mask;
    data[i].inheritable = 0;
  }

  if (syscall(SYS_capset, &hdr, data))
    return -1;
  return 0;
}


int LinuxBackend::RestrictTarget(StatusRecord *failure) {
  for (int cap = 0; cap < 64; cap++) {
    if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) < 0) {
      // EINVAL marks the first capability the kernel does not know.
      if (errno == EINVAL) {
        break;
      }
      return Fail(failure, "prctl", "PR_CAPBSET_DROP");
    }
  }
  if (drop_caps_ep_except(0) < 0) {
    return Fail(failure, "capset", nullptr);
  }
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
    return Fail(failure, "prctl", "PR_SET_NO_NEW_PRIVS");
  }
  return 0;
}

}  // namespace tinycage

#endif  // defined(__linux__)
