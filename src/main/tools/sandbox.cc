/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/sandbox.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/platform-backend.h"
#include "src/main/tools/process-launcher.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <stdlib.h>

namespace tinycage {

// What execvp() searches when PATH is unset.
static const char kDefaultSearchPath[] = "/bin:/usr/bin";

Sandbox::Sandbox() : implicit_library_reads_(true), last_state_(SpawnState::Created) {}


int Sandbox::AddException(const Exception& exception) {
  int res = ValidateException(exception, exceptions_);
  if (res < 0) {
    return res;
  }
  PRINT_DEBUG("adding exception %s", exception.ToString().c_str());
  exceptions_.push_back(exception);
  return 0;
}


std::string Sandbox::SearchPath() const {
  for (const Exception& exception : exceptions_) {
    if (exception.kind() != Exception::Kind::CustomEnvironment) continue;
    auto path = exception.environment().find("PATH");
    return path == exception.environment().end() ? kDefaultSearchPath : path->second;
  }
  const char* path = getenv("PATH");
  return path == nullptr ? kDefaultSearchPath : path;
}


int Sandbox::Resolve(const std::string& cwd, ResolvedPolicy* policy) {
  PolicyOptions options;
  options.cwd = cwd;
  options.search_path = SearchPath();
  options.implicit_library_reads = implicit_library_reads_;

  PolicyBuilder builder(options);
  int res = builder.Build(exceptions_, policy);
  if (res < 0) {
    return res;
  }
  last_warnings_ = policy->warnings();
  for (const ResolutionWarning& warning : last_warnings_) {
    PRINT_DEBUG("warning: %s", warning.message.c_str());
  }
  PRINT_DEBUG("resolved policy:\n%s", policy->ToString().c_str());
  return 0;
}


int Sandbox::ResolvePolicy(ResolvedPolicy* policy) {
  std::string cwd;
  int res = GetCWD(cwd);
  if (res < 0) {
    return res;
  }
  return Resolve(cwd, policy);
}


int Sandbox::Spawn(const Command& command, Child* child) {
  last_state_ = SpawnState::Created;
  std::string cwd;
  int res = GetCWD(cwd);
  if (res < 0) {
    return res;
  }

  ResolvedPolicy policy;
  if ((res = Resolve(cwd, &policy)) < 0) {
    return res;
  }

  std::string found;
  int err = PathResolver::FindProgram(command.program(), SearchPath(), &found);
  if (err == ENOENT) {
    return TinyCageReportOSError(command.program(), ErrorCode::ProgramNotFound, ENOENT);
  }
  if (err != 0) {
    return TinyCageReportOSError(command.program(), ErrorCode::NotPermitted, err);
  }
  PathResolver resolver(cwd);
  ResolvedPath program = resolver.Resolve(found);
  if (!program.exists) {
    return TinyCageReportOSError(found, ErrorCode::ProgramNotFound, program.error);
  }
  if (!policy.Allows(program.path, ACCESS_EXECUTE)) {
    return TinyCageReportOSError(program.path + " is not granted execute access",
                                 ErrorCode::NotPermitted, EACCES);
  }

  SpawnRequest request;
  request.program = program.path;
  request.argv.push_back(command.arg0());
  request.argv.insert(request.argv.end(), command.args().begin(), command.args().end());
  request.env = BuildEnvironment(policy);
  if (command.current_dir().empty()) {
    request.working_dir = cwd;
  } else {
    ResolvedPath dir = resolver.Resolve(command.current_dir());
    request.working_dir = dir.path;
    request.explicit_working_dir = true;
  }
  request.stdin_mode = command.stdin_mode();
  request.stdout_mode = command.stdout_mode();
  request.stderr_mode = command.stderr_mode();

  BackendOptions options;
  options.staging_dir = staging_dir_;
  std::unique_ptr<PlatformBackend> backend = CreatePlatformBackend(options);
  if (!backend) {
    return TinyCageReportOSError("no sandbox backend for this operating system",
                                 ErrorCode::NotSupported, ENOTSUP);
  }
  return LaunchProcess(backend.get(), policy, request, child, &last_state_);
}

}  // namespace tinycage
