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

#include "src/main/tools/tinycage-options.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <fstream>
#include <memory>

using std::ifstream;
using std::unique_ptr;
using std::vector;

namespace tinycage {

// Print out a usage error. argc and argv are the argument counter and vector,
// fmt is a format, string for the error message to print.
static void Usage(char *program_name, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vfprintf(stderr, fmt, ap);
  va_end(ap);

  fprintf(stderr, "\nUsage: %s [options] -- command arg1 @args\n", program_name);
  fprintf(
      stderr,
      "\nPossible arguments:\n"
      "  -r <path>  allow reading a file, or a directory and everything below it\n"
      "  -w <path>  allow reading and writing a path\n"
      "  -x <path>  allow executing a path (implies reading it)\n"
      "  -n  allow network access\n"
      "  -E <NAME=VALUE>  run the command with exactly the given variables "
      "in its environment. Can be repeated\n"
      "  -C <dir>  working directory of the command (uses current directory "
      "if not specified)\n"
      "  -L  do not grant the system library directories to executables\n"
      "  -S <dir>  directory over which the private root is mounted "
      "(Linux only)\n"
      "  -D <debug-file> if set, debug info will be printed to this file\n"
      "  @FILE  read newline-separated arguments from FILE\n"
      "  --  command to run inside sandbox, followed by arguments\n");
  exit(TINYCAGE_EXIT_USAGE);
}


static void AddPathException(char *program_name, Options *opt, const Exception &exception) {
  if (ValidateException(exception, opt->exceptions) < 0) {
    Usage(program_name, "%s", TinyCageGetErrorMsg());
  }
  opt->exceptions.push_back(exception);
}


// Parses command line flags from an argv array and puts the results into an
// Options structure passed in as an argument.
static void ParseCommandLine(unique_ptr<vector<char *>> args, Options *opt) {
  int c;
  bool network = false;

  while ((c = getopt(args->size(), args->data(), ":r:w:x:nE:C:LS:D:")) != -1) {
    switch (c) {
    case 'r':
      AddPathException(args->front(), opt, Exception::Read(optarg));
      break;
    case 'w':
      AddPathException(args->front(), opt, Exception::Write(optarg));
      break;
    case 'x':
      AddPathException(args->front(), opt, Exception::Execute(optarg));
      break;
    case 'n':
      if (!network) {
        opt->exceptions.push_back(Exception::Networking());
        network = true;
      }
      break;
    case 'E': {
      const char *eq = strchr(optarg, '=');
      if (eq == nullptr || eq == optarg) {
        Usage(args->front(), "Invalid environment variable (-E): %s", optarg);
      }
      opt->environment[std::string(optarg, eq - optarg)] = std::string(eq + 1);
      opt->custom_environment = true;
      break;
    }
    case 'C':
      if (opt->working_dir.empty()) {
        opt->working_dir.assign(optarg);
      } else {
        Usage(args->front(), "Multiple working directories (-C) specified, expected one.");
      }
      break;
    case 'L':
      opt->implicit_library_reads = false;
      break;
    case 'S':
      opt->staging_dir.assign(optarg);
      break;
    case 'D':
      if (TinyCageEnableLog(std::string(optarg)) < 0) {
        Usage(args->front(), "%s", TinyCageGetErrorMsg());
      }
      opt->debug_path.assign(optarg);
      break;
    case '?':
      Usage(args->front(), "Unrecognized argument: -%c (%d)", optopt, optind);
      break;
    case ':':
      Usage(args->front(), "Flag -%c requires an argument", optopt);
      break;
    }
  }

  if (opt->custom_environment) {
    Exception env = Exception::CustomEnvironment(opt->environment);
    if (ValidateException(env, opt->exceptions) < 0) {
      Usage(args->front(), "%s", TinyCageGetErrorMsg());
    }
    opt->exceptions.push_back(env);
  }
  if (optind < static_cast<int>(args->size())) {
    opt->args.assign(args->begin() + optind, args->end());
  }
}


// Expands a single argument, expanding options @filename to read in the content
// of the file and add it to the list of processed arguments.
static unique_ptr<vector<char *>>
ExpandArgument(unique_ptr<vector<char *>> expanded, char *arg) {
  if (arg[0] == '@') {
    const char *filename = arg + 1;  // strip off the '@'.
    ifstream f(filename);

    if (!f.is_open()) {
      Usage(expanded->empty() ? arg : expanded->front(),
            "opening argument file %s failed", filename);
    }

    for (std::string line; std::getline(f, line);) {
      if (!line.empty()) {
        expanded = ExpandArgument(std::move(expanded), strdup(line.c_str()));
      }
    }

    if (f.bad()) {
      Usage(expanded->front(), "error while reading from argument file %s", filename);
    }
  } else {
    expanded->push_back(arg);
  }

  return expanded;
}

// Pre-processes an argument list, expanding options @filename to read in the
// content of the file and add it to the list of arguments. Stops expanding
// arguments once it encounters "--".
static unique_ptr<vector<char *>> ExpandArguments(const vector<char *> &args) {
  unique_ptr<vector<char *>> expanded(new vector<char *>());
  expanded->reserve(args.size());
  for (auto arg = args.begin(); arg != args.end(); ++arg) {
    if (strcmp(*arg, "--") != 0) {
      expanded = ExpandArgument(std::move(expanded), *arg);
    } else {
      expanded->insert(expanded->end(), arg, args.end());
      break;
    }
  }
  return expanded;
}

void ParseOptions(int argc, char *argv[], Options *opt) {
  vector<char *> args(argv, argv + argc);
  ParseCommandLine(ExpandArguments(args), opt);

  if (opt->args.empty()) {
    Usage(args.front(), "No command specified.");
  }
}

}  // namespace tinycage
