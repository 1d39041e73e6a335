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

#include "src/main/tools/process-tools.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/error-handling.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <string>
#include <vector>

namespace tinycage {

static std::atomic<int> user_ns_support{NON_INIT};

void InstallSignalHandler(int signum, void (*handler)(int)) {
  struct sigaction sa = {};
  sa.sa_handler = handler;
  if (handler == SIG_IGN || handler == SIG_DFL) {
    // No point in blocking signals when using the default handler or ignoring
    // the signal.
    sigemptyset(&sa.sa_mask);
  } else {
    // When using a custom handler, block all signals from firing while the
    // handler is running.
    sigfillset(&sa.sa_mask);
  }
  // sigaction may fail for certain reserved signals. Ignore failure in this
  // case.
  sigaction(signum, &sa, nullptr);
}


void ClearSignalMask() {
  // Use an empty signal mask for the process.
  sigset_t empty_sset;
  sigemptyset(&empty_sset);
  sigprocmask(SIG_SETMASK, &empty_sset, nullptr);

  // Set the default signal handler for all signals.
  for (int i = 1; i < NSIG; ++i) {
    if (i == SIGKILL || i == SIGSTOP) {
      continue;
    }

    struct sigaction sa = {};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    // Ignore possible errors, because we might not be allowed to set the
    // handler for certain signals, but we still want to try.
    sigaction(i, &sa, nullptr);
  }
}


int WriteFile(const char *filename, const char *contents) {
  int fd = TEMP_FAILURE_RETRY(open(filename, O_WRONLY | O_CLOEXEC));
  if (fd < 0) {
    return -1;
  }
  size_t len = strlen(contents);
  ssize_t written = WriteFully(fd, contents, len);
  int saved_errno = errno;
  close(fd);
  if (written != static_cast<ssize_t>(len)) {
    errno = (written < 0) ? saved_errno : EIO;
    return -1;
  }
  return 0;
}


ssize_t WriteFully(int fd, const void *buf, size_t len) {
  const char *p = static_cast<const char *>(buf);
  size_t done = 0;
  while (done < len) {
    ssize_t n = write(fd, p + done, len - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    done += static_cast<size_t>(n);
  }
  return static_cast<ssize_t>(done);
}


ssize_t ReadFully(int fd, void *buf, size_t len) {
  char *p = static_cast<char *>(buf);
  size_t done = 0;
  while (done < len) {
    ssize_t n = read(fd, p + done, len - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    if (n == 0) break;
    done += static_cast<size_t>(n);
  }
  return static_cast<ssize_t>(done);
}


void KillAndWait(pid_t pid) {
  kill(pid, SIGKILL);
  TEMP_FAILURE_RETRY(waitpid(pid, NULL, 0));
}


int GetCWD(std::string& res) {
  std::error_code ec;
  fs::path currentPath = fs::current_path(ec);
  if (ec) {
    return TinyCageReportOSError("current_path: " + ec.message(), ErrorCode::GeneralOSError,
                                 ec.value());
  }
  res = currentPath.string();
  return 0;
}


static inline void trim(std::string& s) {
  auto is_not_space = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), is_not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), is_not_space).base(), s.end());
}

// Remove surrounding single or double quotes if present
static inline void unquote(std::string& s) {
  if (s.size() >= 2 &&
      ((s.front() == '"' && s.back() == '"') ||
       (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
}

// Parses /etc/os-release and returns NAME and VERSION_ID via out-params.
// Returns true iff at least one of the requested keys was found.
bool GetOSName(std::string& printable_name, std::string& version_id) {
  printable_name.clear();
  version_id.clear();

  std::ifstream file("/etc/os-release");
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#') continue;

    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) continue;

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);

    trim(key);
    trim(value);
    unquote(value);

    if (key == "NAME") {
      printable_name = value;
    } else if (key == "VERSION_ID") {
      version_id = value;
    }

    if (!printable_name.empty() && !version_id.empty()) {
      break;
    }
  }
  return (!printable_name.empty() || !version_id.empty());
}


bool GetKernelInfo(struct utsname* buf) {
  return (uname(buf) == 0);
}


#if defined(__linux__)
static bool HasUserNamespaceSupport() {
    static const char* const paths[] = {
        "/proc/self/ns/user",
        "/proc/self/ns/pid",
        "/proc/self/ns/net",
        "/proc/self/ns/ipc",
        "/proc/self/ns/mnt",
    };

    for (const char* p : paths) {
        if (access(p, F_OK) == -1) {
            return false;
        }
    }
    return true;
}

// Code heavily inspired by
//https://github.com/mozilla-firefox/firefox/blob/131497bb1b747587b2b21b1abf14f44ecffad805/security/sandbox/linux/SandboxInfo.cpp
static bool CanCreateUserNamespace() {
    pid_t pid = static_cast<pid_t>(
        syscall(__NR_clone, SIGCHLD | CLONE_NEWUSER,
                nullptr, nullptr, nullptr, nullptr));

    if (pid == 0) {
        int rv = unshare(CLONE_NEWPID | CLONE_NEWNS);
        _exit(rv == 0 ? 0 : 1);
    }

    if (pid == -1) {
        PRINT_DEBUG("clone(CLONE_NEWUSER) failed: %s", strerror(errno));
        return false;
    }

    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid, &status, 0);
    } while (w == -1 && errno == EINTR);

    if (w == -1) {
        return false;
    }

    bool ok = (WIFEXITED(status) && WEXITSTATUS(status) == 0);
    return ok;
}
#endif


bool UserNamespaceSupported() {
#if defined(__linux__)
  int cached = user_ns_support.load();
  if (cached != NON_INIT)
    return cached == USER_NS_SUPPORTED;
  if (std::getenv("TINYCAGE_FORCE_USER_NAMESPACE") != nullptr)
    return true;

  bool res = HasUserNamespaceSupport() && CanCreateUserNamespace();
  PRINT_DEBUG("user namespaces supported: %d", res);
  user_ns_support.store(res ? USER_NS_SUPPORTED : USER_NS_NOT_SUPPORTED);
  return res;
#else
  return false;
#endif
}

}  // namespace tinycage
