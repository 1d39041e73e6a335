/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/tinycage-api-c.h"
#include "src/main/tools/tinycage-api.h"

#include <errno.h>
#include <new>
#include <string.h>

struct tinycage_sandbox {
  tinycage::Sandbox impl;
};

struct tinycage_child {
  tinycage::Child impl;
};

using namespace tinycage;


static int CheckHandle(const void* handle, const char* what) {
  if (handle == nullptr) {
    return TinyCageReportErrorAndMessage(std::string("null ") + what, ErrorCode::InvalidArgument);
  }
  return 0;
}


static int ToStdio(int mode, Stdio* out) {
  switch (mode) {
    case TINYCAGE_STDIO_INHERIT:
      *out = Stdio::Inherit;
      return 0;
    case TINYCAGE_STDIO_NULL:
      *out = Stdio::Null;
      return 0;
    case TINYCAGE_STDIO_PIPED:
      *out = Stdio::Piped;
      return 0;
  }
  return TinyCageReportErrorAndMessage("stdio mode " + std::to_string(mode),
                                       ErrorCode::InvalidArgument);
}


tinycage_sandbox* tinycage_sandbox_new() {
  return new (std::nothrow) tinycage_sandbox();
}


void tinycage_sandbox_free(tinycage_sandbox* sandbox) {
  delete sandbox;
}


int tinycage_allow_read(tinycage_sandbox* sandbox, const char* path) {
  if (CheckHandle(sandbox, "sandbox") < 0 || CheckHandle(path, "path") < 0) return -1;
  return sandbox->impl.AddException(Exception::Read(path));
}


int tinycage_allow_write(tinycage_sandbox* sandbox, const char* path) {
  if (CheckHandle(sandbox, "sandbox") < 0 || CheckHandle(path, "path") < 0) return -1;
  return sandbox->impl.AddException(Exception::Write(path));
}


int tinycage_allow_execute(tinycage_sandbox* sandbox, const char* path) {
  if (CheckHandle(sandbox, "sandbox") < 0 || CheckHandle(path, "path") < 0) return -1;
  return sandbox->impl.AddException(Exception::Execute(path));
}


int tinycage_allow_networking(tinycage_sandbox* sandbox) {
  if (CheckHandle(sandbox, "sandbox") < 0) return -1;
  return sandbox->impl.AddException(Exception::Networking());
}


int tinycage_set_environment(tinycage_sandbox* sandbox, const char* const* env) {
  if (CheckHandle(sandbox, "sandbox") < 0 || CheckHandle(env, "environment") < 0) return -1;
  EnvironmentMap map;
  for (const char* const* var = env; *var != nullptr; ++var) {
    const char* eq = strchr(*var, '=');
    if (eq == nullptr || eq == *var) {
      return TinyCageReportErrorAndMessage(std::string("environment entry ") + *var,
                                           ErrorCode::InvalidException);
    }
    map[std::string(*var, eq - *var)] = std::string(eq + 1);
  }
  return sandbox->impl.AddException(Exception::CustomEnvironment(map));
}


int tinycage_set_implicit_library_reads(tinycage_sandbox* sandbox, int enabled) {
  if (CheckHandle(sandbox, "sandbox") < 0) return -1;
  sandbox->impl.SetImplicitLibraryReads(enabled != 0);
  return 0;
}


int tinycage_set_staging_directory(tinycage_sandbox* sandbox, const char* path) {
  if (CheckHandle(sandbox, "sandbox") < 0 || CheckHandle(path, "path") < 0) return -1;
  sandbox->impl.SetStagingDirectory(path);
  return 0;
}


int tinycage_spawn(tinycage_sandbox* sandbox, const char* program, const char* const* argv,
                   const char* working_dir, int stdin_mode, int stdout_mode, int stderr_mode,
                   tinycage_child** child) {
  if (CheckHandle(sandbox, "sandbox") < 0 || CheckHandle(program, "program") < 0 ||
      CheckHandle(child, "child") < 0) {
    return -1;
  }
  Command command(program);
  if (argv != nullptr && argv[0] != nullptr) {
    command.Arg0(argv[0]);
    for (const char* const* arg = argv + 1; *arg != nullptr; ++arg) {
      command.Arg(*arg);
    }
  }
  if (working_dir != nullptr) {
    command.CurrentDir(working_dir);
  }
  Stdio in, out, err;
  if (ToStdio(stdin_mode, &in) < 0 || ToStdio(stdout_mode, &out) < 0 ||
      ToStdio(stderr_mode, &err) < 0) {
    return -1;
  }
  command.Stdin(in).Stdout(out).Stderr(err);

  tinycage_child* handle = new (std::nothrow) tinycage_child();
  if (handle == nullptr) {
    return TinyCageReportOSError("allocating the child handle", ErrorCode::ProcessCreation,
                                 ENOMEM);
  }
  int res = sandbox->impl.Spawn(command, &handle->impl);
  if (res < 0) {
    delete handle;
    return res;
  }
  *child = handle;
  return 0;
}


pid_t tinycage_child_pid(const tinycage_child* child) {
  return child == nullptr ? -1 : child->impl.pid();
}


int tinycage_child_stdin(const tinycage_child* child) {
  return child == nullptr ? -1 : child->impl.stdin_fd();
}


int tinycage_child_stdout(const tinycage_child* child) {
  return child == nullptr ? -1 : child->impl.stdout_fd();
}


int tinycage_child_stderr(const tinycage_child* child) {
  return child == nullptr ? -1 : child->impl.stderr_fd();
}


int tinycage_child_wait(tinycage_child* child, int* exit_code) {
  if (CheckHandle(child, "child") < 0 || CheckHandle(exit_code, "exit code") < 0) return -1;
  ExitStatus status;
  int res = child->impl.Wait(&status);
  if (res < 0) {
    return res;
  }
  *exit_code = status.ShellCode();
  return 0;
}


int tinycage_child_kill(tinycage_child* child) {
  if (CheckHandle(child, "child") < 0) return -1;
  return child->impl.Kill();
}


int tinycage_child_signal(tinycage_child* child, int signum) {
  if (CheckHandle(child, "child") < 0) return -1;
  return child->impl.Signal(signum);
}


void tinycage_child_free(tinycage_child* child) {
  delete child;
}


int tinycage_enable_log(const char* path) {
  if (CheckHandle(path, "path") < 0) return -1;
  return TinyCageEnableLog(path);
}


int tinycage_get_last_error_code() {
  return TinyCageGetErrorCode();
}


const char* tinycage_get_last_error_msg() {
  return TinyCageGetErrorMsg();
}


int tinycage_get_last_error_errno() {
  return TinyCageGetErrorErrno();
}
