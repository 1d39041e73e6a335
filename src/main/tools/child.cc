/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/child.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tinycage {

std::string ExitStatus::ToString() const {
  if (exited) {
    return "exit code " + std::to_string(code);
  }
  return "signal " + std::to_string(signal);
}


Child::Child() { Reset(); }

Child::Child(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd),
      reaped_(false) {}

Child::~Child() { CloseFds(); }

Child::Child(Child&& other) noexcept
    : pid_(other.pid_), stdin_fd_(other.stdin_fd_), stdout_fd_(other.stdout_fd_),
      stderr_fd_(other.stderr_fd_), reaped_(other.reaped_), status_(other.status_) {
  other.Reset();
}

Child& Child::operator=(Child&& other) noexcept {
  if (this != &other) {
    CloseFds();
    pid_ = other.pid_;
    stdin_fd_ = other.stdin_fd_;
    stdout_fd_ = other.stdout_fd_;
    stderr_fd_ = other.stderr_fd_;
    reaped_ = other.reaped_;
    status_ = other.status_;
    other.Reset();
  }
  return *this;
}


void Child::Reset() {
  pid_ = -1;
  stdin_fd_ = -1;
  stdout_fd_ = -1;
  stderr_fd_ = -1;
  reaped_ = false;
  status_ = ExitStatus();
}


void Child::CloseFds() {
  for (int *fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
    if (*fd >= 0) {
      close(*fd);
      *fd = -1;
    }
  }
}


void Child::CloseStdin() {
  if (stdin_fd_ >= 0) {
    close(stdin_fd_);
    stdin_fd_ = -1;
  }
}


void Child::Record(int wstatus) {
  reaped_ = true;
  status_ = ExitStatus();
  if (WIFEXITED(wstatus)) {
    status_.exited = true;
    status_.code = WEXITSTATUS(wstatus);
  } else if (WIFSIGNALED(wstatus)) {
    status_.signal = WTERMSIG(wstatus);
  }
  PRINT_DEBUG("child %d finished with %s", pid_, status_.ToString().c_str());
}


int Child::Wait(ExitStatus* status) {
  if (!valid()) {
    return TinyCageReportOSError("wait on an empty handle", ErrorCode::ChildError, EINVAL);
  }
  if (!reaped_) {
    int wstatus;
    if (TEMP_FAILURE_RETRY(waitpid(pid_, &wstatus, 0)) < 0) {
      return TinyCageReportOSError("waitpid " + std::to_string(pid_), ErrorCode::ChildError,
                                   errno);
    }
    Record(wstatus);
  }
  *status = status_;
  return 0;
}


int Child::TryWait(ExitStatus* status, bool* done) {
  if (!valid()) {
    return TinyCageReportOSError("wait on an empty handle", ErrorCode::ChildError, EINVAL);
  }
  if (!reaped_) {
    int wstatus;
    pid_t res = TEMP_FAILURE_RETRY(waitpid(pid_, &wstatus, WNOHANG));
    if (res < 0) {
      return TinyCageReportOSError("waitpid " + std::to_string(pid_), ErrorCode::ChildError,
                                   errno);
    }
    if (res == 0) {
      *done = false;
      return 0;
    }
    Record(wstatus);
  }
  *done = true;
  *status = status_;
  return 0;
}


int Child::WaitWithOutput(Output* output) {
  CloseStdin();
  output->stdout_data.clear();
  output->stderr_data.clear();

  char buf[4096];
  while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
    struct pollfd fds[2];
    int *owners[2];
    std::string *sinks[2];
    nfds_t count = 0;
    if (stdout_fd_ >= 0) {
      fds[count] = {stdout_fd_, POLLIN, 0};
      owners[count] = &stdout_fd_;
      sinks[count++] = &output->stdout_data;
    }
    if (stderr_fd_ >= 0) {
      fds[count] = {stderr_fd_, POLLIN, 0};
      owners[count] = &stderr_fd_;
      sinks[count++] = &output->stderr_data;
    }
    if (poll(fds, count, -1) < 0) {
      if (errno == EINTR) continue;
      return TinyCageReportOSError("poll", ErrorCode::ChildError, errno);
    }
    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;
      ssize_t n = read(fds[i].fd, buf, sizeof(buf));
      if (n < 0 && errno == EINTR) continue;
      if (n < 0) {
        return TinyCageReportOSError("read", ErrorCode::ChildError, errno);
      }
      if (n == 0) {
        close(*owners[i]);
        *owners[i] = -1;
        continue;
      }
      sinks[i]->append(buf, static_cast<size_t>(n));
    }
  }
  return Wait(&output->status);
}


int Child::Kill() { return Signal(SIGKILL); }


int Child::Signal(int signum) {
  if (!valid() || reaped_) {
    return TinyCageReportOSError("signal " + std::to_string(signum) + " to a finished child",
                                 ErrorCode::ChildError, ESRCH);
  }
  if (kill(pid_, signum) < 0) {
    return TinyCageReportOSError("kill " + std::to_string(pid_), ErrorCode::ChildError, errno);
  }
  return 0;
}

}  // namespace tinycage
