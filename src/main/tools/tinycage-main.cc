/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"
#include "src/main/tools/sandbox.h"
#include "src/main/tools/tinycage-options.h"

#include <signal.h>
#include <stdio.h>

#include <atomic>

using namespace tinycage;

// The PID of our child process, for use in signal handlers.
static std::atomic<pid_t> global_child_pid{0};

static void ForwardSignal(int signum) {
  const pid_t child_pid = global_child_pid.load(std::memory_order_relaxed);
  if (child_pid > 0) {
    kill(child_pid, signum);
  }
}


static int SpawnExitCode() {
  switch (static_cast<ErrorCode>(TinyCageGetErrorCode())) {
    case ErrorCode::ProgramNotFound:
      return TINYCAGE_EXIT_NOT_FOUND;
    case ErrorCode::NotPermitted:
      return TINYCAGE_EXIT_NOT_EXECUTABLE;
    case ErrorCode::ExecFailed:
      return TinyCageGetErrorErrno() == ENOENT ? TINYCAGE_EXIT_NOT_FOUND
                                               : TINYCAGE_EXIT_NOT_EXECUTABLE;
    default:
      return TINYCAGE_EXIT_SETUP;
  }
}


int main(int argc, char *argv[]) {
  Options opt;
  ParseOptions(argc, argv, &opt);

  Sandbox sandbox;
  sandbox.SetImplicitLibraryReads(opt.implicit_library_reads);
  if (!opt.staging_dir.empty()) {
    sandbox.SetStagingDirectory(opt.staging_dir);
  }
  for (const Exception &exception : opt.exceptions) {
    if (sandbox.AddException(exception) < 0) {
      fprintf(stderr, "tinycage: %s\n", TinyCageGetErrorMsg());
      return TINYCAGE_EXIT_USAGE;
    }
  }

  Command command(opt.args.front());
  command.Args(std::vector<std::string>(opt.args.begin() + 1, opt.args.end()));
  if (!opt.working_dir.empty()) {
    command.CurrentDir(opt.working_dir);
  }

  Child child;
  if (sandbox.Spawn(command, &child) < 0) {
    fprintf(stderr, "tinycage: %s\n", TinyCageGetErrorMsg());
    return SpawnExitCode();
  }
  for (const ResolutionWarning &warning : sandbox.LastWarnings()) {
    PRINT_DEBUG("unresolved: %s", warning.message.c_str());
  }

  global_child_pid.store(child.pid(), std::memory_order_relaxed);
  for (int signum : {SIGTERM, SIGINT, SIGHUP, SIGQUIT}) {
    InstallSignalHandler(signum, ForwardSignal);
  }

  ExitStatus status;
  if (child.Wait(&status) < 0) {
    fprintf(stderr, "tinycage: %s\n", TinyCageGetErrorMsg());
    return TINYCAGE_EXIT_SETUP;
  }
  PRINT_DEBUG("child finished with %s", status.ToString().c_str());
  return status.ShellCode();
}
