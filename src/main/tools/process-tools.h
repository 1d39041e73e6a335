// Copyright 2015 The Bazel Authors. All rights reserved.
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

#ifndef SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
#define SRC_MAIN_TOOLS_PROCESS_TOOLS_H_

#include <stdbool.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <string>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#define _EXPERIMENTAL_FILESYSTEM_
#endif

#ifndef TEMP_FAILURE_RETRY
#define TEMP_FAILURE_RETRY(expression)             \
  (__extension__({                                 \
    long int __result;                             \
    do __result = (long int)(expression);          \
    while (__result == -1L && errno == EINTR);     \
    __result;                                      \
  }))
#endif

namespace tinycage {

// Set up a signal handler for a signal.
void InstallSignalHandler(int signum, void (*handler)(int));

// Use an empty signal mask for the process and set all signal handlers to their
// default. Only issues system calls, so it is usable in a freshly cloned child.
void ClearSignalMask();

// Writes `contents` to `filename` with a single write(2). Returns 0 or -1 with
// errno set. Does not allocate and can run between clone() and execve().
int WriteFile(const char *filename, const char *contents);

// write(2) and read(2) that retry on EINTR and short transfers. Return the
// number of bytes transferred or -1 with errno set.
ssize_t WriteFully(int fd, const void *buf, size_t len);
ssize_t ReadFully(int fd, void *buf, size_t len);

// Sends SIGKILL to `pid` and reaps it.
void KillAndWait(pid_t pid);

int GetCWD(std::string& res);

bool GetOSName(std::string& printable_name, std::string& version_id);
bool GetKernelInfo(struct utsname* buf);

// Returns true when unprivileged user, mount and PID namespaces can be
// created. The probe runs once per process; TINYCAGE_FORCE_USER_NAMESPACE
// skips it.
bool UserNamespaceSupported();


enum UserNamespaceSupport {
    NON_INIT,
    USER_NS_SUPPORTED,
    USER_NS_NOT_SUPPORTED
};

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_PROCESS_TOOLS_H_
