// Copyright 2017 The Bazel Authors. All rights reserved.
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

#include "src/main/tools/logging.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/process-tools.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <sys/utsname.h>
#if defined(__GLIBC__)
#include <gnu/libc-version.h>
#endif

#include <mutex>
#include <stdexcept>
#include <string>

namespace tinycage {

FILE *global_debug = nullptr;

static std::mutex log_mutex;
static std::string log_path;


static void logOSKernel() {
  struct utsname buf;
  bool res = GetKernelInfo(&buf);
  if (res) {
    PRINT_DEBUG("OS: %s", buf.sysname);
    PRINT_DEBUG("Kernel: %s", buf.release);
    PRINT_DEBUG("Version: %s", buf.version);
    PRINT_DEBUG("Machine: %s", buf.machine);
  } else {
    PRINT_DEBUG("uname failed: %s", strerror(errno));
  }
}


static void logLibc() {
#if defined(__GLIBC__)
  PRINT_DEBUG("libc: %s", gnu_get_libc_version());
#else
  PRINT_DEBUG("libc: not glibc");
#endif
}


static void logLibstdcpp() {
#ifdef _GLIBCXX_RELEASE
    PRINT_DEBUG("libstdc++ release: %d", _GLIBCXX_RELEASE);
#endif

#ifdef __GLIBCXX__
    PRINT_DEBUG("__GLIBCXX__: %d", __GLIBCXX__);
#endif

#ifdef _LIBCPP_VERSION
    PRINT_DEBUG("libc++: %d", _LIBCPP_VERSION);
#endif
}


static void logOSName() {
  try {
    std::string pretty, version;
    const bool ok = GetOSName(pretty, version);

    if (!ok) {
      PRINT_DEBUG("Can't log OS info: /etc/os-release missing or keys not found");
      return;
    }

    if (!pretty.empty()) {
      PRINT_DEBUG("OS PRETTY_NAME: %s", pretty.c_str());
    } else {
      PRINT_DEBUG("OS PRETTY_NAME not found");
    }

    if (!version.empty()) {
      PRINT_DEBUG("OS VERSION_ID: %s", version.c_str());
    } else {
      PRINT_DEBUG("OS VERSION_ID not found");
    }
  } catch (const std::exception& e) {
    PRINT_DEBUG("Can't log OS info (exception): %s", e.what());
  }
}


void logSystem() {
  logOSKernel();
  logOSName();
  logLibc();
  logLibstdcpp();
}


int TinyCageEnableLog(const std::string &path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (!log_path.empty()) {
    return TinyCageReportErrorAndMessage(path, ErrorCode::LogFileNotUnique);
  }
  if (path.empty()) {
    return TinyCageReportErrorAndMessage("empty log path", ErrorCode::InvalidArgument);
  }

  fs::path fs_path(path);
  fs::path base_dir = fs_path.parent_path();
  if (base_dir.empty())
    base_dir = ".";
  struct stat sb;
  if (stat(base_dir.c_str(), &sb) < 0) {
    return TinyCageReportOSError(base_dir.string(), ErrorCode::InvalidArgument, errno);
  }
  if (!S_ISDIR(sb.st_mode)) {
    return TinyCageReportOSError(base_dir.string(), ErrorCode::InvalidArgument, ENOTDIR);
  }

  // Children must not inherit the log descriptor.
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return TinyCageReportOSError(path, ErrorCode::GeneralOSError, errno);
  }
  FILE *stream = fdopen(fd, "w");
  if (stream == nullptr) {
    int err = errno;
    close(fd);
    return TinyCageReportOSError(path, ErrorCode::GeneralOSError, err);
  }
  log_path = path;
  global_debug = stream;
  PRINT_DEBUG("debug log enabled at %s", path.c_str());
  logSystem();
  return 0;
}

}  // namespace tinycage
