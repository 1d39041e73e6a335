/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/process-launcher.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern char **environ;
#endif

namespace tinycage {

// Everything the child needs, laid out by the parent before the child exists.
struct ChildContext {
  PlatformBackend *backend;
  int status_read;
  int status_write;
  // Child side of stdin, stdout and stderr, -1 to inherit.
  int stdio[3];
  // Parent side of piped streams.
  int parent_ends[3];
  const char *program;
  char *const *argv;
  char *const *envp;
  // Upper bound for descriptor numbers, from sysconf(_SC_OPEN_MAX).
  int max_fd;
};

static pid_t global_target_pid = -1;


static void ReportToParent(const ChildContext *ctx, const StatusRecord &record) {
  WriteFully(ctx->status_write, &record, sizeof(record));
}


static void ExecTarget(const ChildContext *ctx) {
  execve(ctx->program, ctx->argv, ctx->envp);
  StatusRecord record;
  FillStatusRecord(&record, STAGE_EXEC_FAILED, errno, "execve", ctx->program);
  ReportToParent(ctx, record);
  _exit(127);
}


static void ForwardSignal(int signum) {
  if (global_target_pid > 0) {
    kill(global_target_pid, signum);
  }
}


// Reaps everything reparented to us and returns the status of the target.
static int WaitForChild() {
  while (true) {
    int status;
    const pid_t pid = TEMP_FAILURE_RETRY(wait(&status));
    if (pid < 0) {
      return 125;
    }
    if (pid != global_target_pid) {
      continue;
    }
    if (WIFSIGNALED(status)) {
      return 128 + WTERMSIG(status);
    }
    return WEXITSTATUS(status);
  }
}


static int RunAsInit(const ChildContext *ctx) {
  global_target_pid = fork();
  if (global_target_pid < 0) {
    StatusRecord record;
    FillStatusRecord(&record, STAGE_POLICY_FAILED, errno, "fork", "target");
    ReportToParent(ctx, record);
    return 125;
  }
  if (global_target_pid == 0) {
    ExecTarget(ctx);
  }

  // As init of the PID namespace we only receive signals we have a handler
  // for, so the handlers must be in place before the parent can see the
  // spawn succeed.
  for (int signum : {SIGTERM, SIGINT, SIGHUP, SIGQUIT, SIGUSR1, SIGUSR2}) {
    InstallSignalHandler(signum, ForwardSignal);
  }
  // The pipe must reach end-of-file as soon as the target has exec'd.
  close(ctx->status_write);
  return WaitForChild();
}


// Closes every descriptor above stderr except `keep`. Descriptors the caller
// left open without close-on-exec must not reach the target: a directory
// descriptor reopened through /proc/self/fd ignores the mount plan.
static void CloseInheritedFds(int keep, int max_fd) {
#if defined(__linux__) && defined(SYS_close_range)
  if ((keep == 3 || syscall(SYS_close_range, 3, keep - 1, 0) == 0) &&
      syscall(SYS_close_range, keep + 1, ~0U, 0) == 0) {
    return;
  }
#endif
  for (int fd = 3; fd < max_fd; ++fd) {
    if (fd != keep) close(fd);
  }
}


static int ChildMain(void *arg) {
  const ChildContext *ctx = static_cast<const ChildContext *>(arg);
  StatusRecord record;

  close(ctx->status_read);
  for (int fd : ctx->parent_ends) {
    if (fd >= 0) close(fd);
  }
  for (int i = 0; i < 3; ++i) {
    if (ctx->stdio[i] < 0) continue;
    if (dup2(ctx->stdio[i], i) < 0) {
      FillStatusRecord(&record, STAGE_POLICY_FAILED, errno, "dup2", nullptr);
      ReportToParent(ctx, record);
      return 125;
    }
    close(ctx->stdio[i]);
  }
  CloseInheritedFds(ctx->status_write, ctx->max_fd);
  ClearSignalMask();

  if (ctx->backend->Apply(&record) < 0 || ctx->backend->RestrictTarget(&record) < 0) {
    ReportToParent(ctx, record);
    return 125;
  }
  FillStatusRecord(&record, STAGE_POLICY_APPLIED, 0, nullptr, nullptr);
  ReportToParent(ctx, record);

  if (ctx->backend->RunsAsInit()) {
    return RunAsInit(ctx);
  }
  ExecTarget(ctx);
  return 127;
}


// Moves `fd` out of the 0-2 range so that dup2() in the child cannot clobber
// another stream. Closes `fd` in any case.
static int AboveStdio(int fd) {
  if (fd < 0 || fd > 2) return fd;
  int res = fcntl(fd, F_DUPFD_CLOEXEC, 3);
  int saved_errno = errno;
  close(fd);
  errno = saved_errno;
  return res;
}


static int MakePipe(int fds[2]) {
#if defined(__linux__)
  if (pipe2(fds, O_CLOEXEC) < 0) return -1;
#else
  if (pipe(fds) < 0) return -1;
  if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) < 0 || fcntl(fds[1], F_SETFD, FD_CLOEXEC) < 0) {
    int saved_errno = errno;
    close(fds[0]);
    close(fds[1]);
    errno = saved_errno;
    return -1;
  }
#endif
  fds[0] = AboveStdio(fds[0]);
  fds[1] = AboveStdio(fds[1]);
  if (fds[0] < 0 || fds[1] < 0) {
    int saved_errno = errno;
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    errno = saved_errno;
    return -1;
  }
  return 0;
}


static void CloseAll(ChildContext *ctx) {
  for (int *fd : {&ctx->status_read, &ctx->status_write}) {
    if (*fd >= 0) close(*fd);
    *fd = -1;
  }
  for (int i = 0; i < 3; ++i) {
    if (ctx->stdio[i] >= 0) close(ctx->stdio[i]);
    if (ctx->parent_ends[i] >= 0) close(ctx->parent_ends[i]);
    ctx->stdio[i] = ctx->parent_ends[i] = -1;
  }
}


// Sets up stream `index` of the child. Input streams read from the pipe,
// output streams write to it.
static int SetupStream(ChildContext *ctx, int index, Stdio mode) {
  if (mode == Stdio::Inherit) {
    return 0;
  }
  if (mode == Stdio::Null) {
    int fd = AboveStdio(open("/dev/null", O_RDWR | O_CLOEXEC));
    if (fd < 0) {
      return TinyCageReportOSError("open /dev/null", ErrorCode::ProcessCreation, errno);
    }
    ctx->stdio[index] = fd;
    return 0;
  }
  int fds[2];
  if (MakePipe(fds) < 0) {
    return TinyCageReportOSError("pipe", ErrorCode::ProcessCreation, errno);
  }
  if (index == STDIN_FILENO) {
    ctx->stdio[index] = fds[0];
    ctx->parent_ends[index] = fds[1];
  } else {
    ctx->stdio[index] = fds[1];
    ctx->parent_ends[index] = fds[0];
  }
  return 0;
}


static std::vector<char *> ToArgv(const std::vector<std::string> &strings) {
  std::vector<char *> res;
  for (const std::string &s : strings) {
    res.push_back(const_cast<char *>(s.c_str()));
  }
  res.push_back(nullptr);
  return res;
}


std::vector<std::string> BuildEnvironment(const ResolvedPolicy &policy) {
  std::vector<std::string> res;
  if (policy.has_custom_environment()) {
    for (const auto &var : policy.environment()) {
      res.push_back(var.first + "=" + var.second);
    }
    return res;
  }
  for (char **var = environ; var != nullptr && *var != nullptr; ++var) {
    res.push_back(*var);
  }
  return res;
}


int LaunchProcess(PlatformBackend *backend, const ResolvedPolicy &policy,
                  const SpawnRequest &request, Child *child, SpawnState *final_state) {
  SpawnStateMachine machine;
  auto finish = [&machine, final_state](int res) {
    if (final_state != nullptr) *final_state = machine.state();
    return res;
  };
  auto fail = [&machine, &finish](int res) {
    machine.Advance(SpawnState::Failed);
    return finish(res);
  };

  PRINT_DEBUG("spawning %s with the %s backend", request.program.c_str(), backend->Name());
  int res = backend->Prepare(policy, request.working_dir, request.explicit_working_dir);
  if (res < 0) {
    return fail(res);
  }

  std::vector<char *> argv = ToArgv(request.argv);
  std::vector<char *> envp = ToArgv(request.env);

  ChildContext ctx;
  ctx.backend = backend;
  ctx.status_read = ctx.status_write = -1;
  for (int i = 0; i < 3; ++i) {
    ctx.stdio[i] = ctx.parent_ends[i] = -1;
  }
  ctx.program = request.program.c_str();
  ctx.argv = argv.data();
  ctx.envp = envp.data();
  const long open_max = sysconf(_SC_OPEN_MAX);
  ctx.max_fd = open_max > 0 && open_max < INT_MAX ? static_cast<int>(open_max) : 65536;

  int status_pipe[2];
  if (MakePipe(status_pipe) < 0) {
    return fail(TinyCageReportOSError("status pipe", ErrorCode::ProcessCreation, errno));
  }
  ctx.status_read = status_pipe[0];
  ctx.status_write = status_pipe[1];

  const Stdio modes[3] = {request.stdin_mode, request.stdout_mode, request.stderr_mode};
  for (int i = 0; i < 3; ++i) {
    if ((res = SetupStream(&ctx, i, modes[i])) < 0) {
      CloseAll(&ctx);
      return fail(res);
    }
  }

  const pid_t pid = backend->CreateChild(ChildMain, &ctx);
  if (pid < 0) {
    res = TinyCageReportOSError("creating the child with " + std::string(backend->Name()),
                                ErrorCode::ProcessCreation, errno);
    CloseAll(&ctx);
    return fail(res);
  }
  machine.Advance(SpawnState::Forked);
  PRINT_DEBUG("child pid %d", pid);

  close(ctx.status_write);
  ctx.status_write = -1;
  for (int i = 0; i < 3; ++i) {
    if (ctx.stdio[i] >= 0) close(ctx.stdio[i]);
    ctx.stdio[i] = -1;
  }

  StatusRecord record;
  while (true) {
    ssize_t n = ReadFully(ctx.status_read, &record, sizeof(record));
    if (n == 0) {
      break;
    }
    if (n != static_cast<ssize_t>(sizeof(record))) {
      const int err = n < 0 ? errno : EIO;
      KillAndWait(pid);
      res = TinyCageReportOSError("reading the child status", ErrorCode::ProcessCreation, err);
      CloseAll(&ctx);
      return fail(res);
    }
    if (record.stage == STAGE_POLICY_APPLIED) {
      if (machine.Advance(SpawnState::PolicyApplied) < 0) {
        KillAndWait(pid);
        CloseAll(&ctx);
        return fail(UNRECOVERABLE_FAIL);
      }
      continue;
    }

    KillAndWait(pid);
    record.msg[MAX_STATUS_MSG - 1] = '\0';
    PRINT_DEBUG("child failed at stage %d: %s (errno %d)", record.stage, record.msg,
                record.err);
    const ErrorCode code =
        record.stage == STAGE_EXEC_FAILED ? ErrorCode::ExecFailed : ErrorCode::PolicyApplication;
    res = TinyCageReportOSError(record.msg, code, record.err);
    CloseAll(&ctx);
    return fail(res);
  }

  if (machine.state() != SpawnState::PolicyApplied) {
    TEMP_FAILURE_RETRY(waitpid(pid, nullptr, 0));
    res = TinyCageReportOSError("child exited before applying the policy",
                                ErrorCode::ProcessCreation, ECHILD);
    CloseAll(&ctx);
    return fail(res);
  }
  machine.Advance(SpawnState::Execd);

  close(ctx.status_read);
  *child = Child(pid, ctx.parent_ends[0], ctx.parent_ends[1], ctx.parent_ends[2]);
  return finish(0);
}

}  // namespace tinycage
