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

#ifndef SRC_MAIN_TOOLS_LOGGING_H_
#define SRC_MAIN_TOOLS_LOGGING_H_

#include <inttypes.h>
#include <stdint.h>
#include <stdio.h>
#include <time.h>

#include <string>

namespace tinycage {

// File that debug output is written to. Null until TinyCageEnableLog() is
// called, in which case PRINT_DEBUG() is a no-op.
extern FILE *global_debug;

// Opens `path` for debug output and logs a description of the host. The
// parent directory of `path` has to exist and only one log file is allowed
// per process.
int TinyCageEnableLog(const std::string &path);

// Logs kernel, distribution and C/C++ runtime versions.
void logSystem();

}  // namespace tinycage

// Must never be called from a sandboxed child between clone() and execve().
#define PRINT_DEBUG(fmt, ...)                                              \
  do {                                                                     \
    if (::tinycage::global_debug != nullptr) {                             \
      struct timespec ts;                                                  \
      clock_gettime(CLOCK_REALTIME, &ts);                                  \
                                                                           \
      fprintf(::tinycage::global_debug,                                    \
              "%" PRId64 ".%09ld: %s:%d: " fmt "\n",                       \
              static_cast<int64_t>(ts.tv_sec), static_cast<long>(ts.tv_nsec), \
              __FILE__, __LINE__, ##__VA_ARGS__);                          \
      fflush(::tinycage::global_debug);                                    \
    }                                                                      \
  } while (0)

#endif  // SRC_MAIN_TOOLS_LOGGING_H_
