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

#ifndef SRC_MAIN_TOOLS_TINYCAGE_OPTIONS_H_
#define SRC_MAIN_TOOLS_TINYCAGE_OPTIONS_H_

#include <string>
#include <vector>

#include "src/main/tools/exception.h"

// Exit codes of the tinycage command besides the child's own.
#define TINYCAGE_EXIT_USAGE 2
#define TINYCAGE_EXIT_SETUP 125
#define TINYCAGE_EXIT_NOT_EXECUTABLE 126
#define TINYCAGE_EXIT_NOT_FOUND 127

namespace tinycage {

struct Options {
  // Grants collected from -r, -w, -x and -n, in command line order
  std::vector<Exception> exceptions;
  // Variables collected from -E
  EnvironmentMap environment;
  bool custom_environment = false;
  // Working directory of the child (-C)
  std::string working_dir;
  // Grant the system library directories to executables (-L disables)
  bool implicit_library_reads = true;
  // Print debugging messages (-D)
  std::string debug_path;
  // Host directory for the private root of the child (-S)
  std::string staging_dir;
  // Command to run (--)
  std::vector<std::string> args;
};

// Parses argv into `opt`. Prints the usage and exits with
// TINYCAGE_EXIT_USAGE on malformed input.
void ParseOptions(int argc, char *argv[], Options *opt);

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_TINYCAGE_OPTIONS_H_
