/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_CHILD_H_
#define SRC_MAIN_TOOLS_CHILD_H_

#include <sys/types.h>

#include <string>

namespace tinycage {

struct ExitStatus {
  bool exited = false;
  int code = -1;
  // Terminating signal when the child did not exit on its own, 0 otherwise.
  int signal = 0;

  bool success() const { return exited && code == 0; }
  // Shell style status: the exit code, or 128 + signal.
  int ShellCode() const { return exited ? code : 128 + signal; }
  std::string ToString() const;
};

struct Output {
  ExitStatus status;
  std::string stdout_data;
  std::string stderr_data;
};

// Handle of a sandboxed process. Owns the parent ends of the piped streams
// and closes them when destroyed. Dropping a handle neither kills nor reaps
// the process.
class Child {
 public:
  Child();
  Child(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
  ~Child();

  Child(Child&& other) noexcept;
  Child& operator=(Child&& other) noexcept;
  Child(const Child&) = delete;
  Child& operator=(const Child&) = delete;

  pid_t pid() const { return pid_; }
  bool valid() const { return pid_ > 0; }

  // Parent ends of the piped streams, -1 when the stream was not piped.
  int stdin_fd() const { return stdin_fd_; }
  int stdout_fd() const { return stdout_fd_; }
  int stderr_fd() const { return stderr_fd_; }

  // Closes the write end of stdin so the child sees end-of-file.
  void CloseStdin();

  // Blocks until the process exits. Returns 0 or reports ChildError.
  int Wait(ExitStatus* status);

  // Sets `*done` and, when the process has exited, `*status`, without
  // blocking.
  int TryWait(ExitStatus* status, bool* done);

  // Closes stdin, drains the piped streams and waits for the process.
  int WaitWithOutput(Output* output);

  // SIGKILL. Reports ChildError once the process has been reaped.
  int Kill();
  int Signal(int signum);

 private:
  void Reset();
  void CloseFds();
  void Record(int wstatus);

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  bool reaped_;
  ExitStatus status_;
};

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_CHILD_H_
