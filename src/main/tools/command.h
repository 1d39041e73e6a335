/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_COMMAND_H_
#define SRC_MAIN_TOOLS_COMMAND_H_

#include <string>
#include <vector>

namespace tinycage {

// What a standard stream of the child is connected to.
enum class Stdio {
  // The caller's own descriptor.
  Inherit,
  // /dev/null.
  Null,
  // A pipe whose other end is kept by the Child handle.
  Piped,
};

// Description of the program to run inside a sandbox. The program can be an
// absolute or relative path, or a bare name looked up in PATH.
class Command {
 public:
  explicit Command(const std::string& program);

  // Name the target sees as argv[0]. Defaults to the program as given.
  Command& Arg0(const std::string& name);
  Command& Arg(const std::string& arg);
  Command& Args(const std::vector<std::string>& args);
  Command& CurrentDir(const std::string& dir);
  Command& Stdin(Stdio mode);
  Command& Stdout(Stdio mode);
  Command& Stderr(Stdio mode);

  const std::string& program() const { return program_; }
  const std::string& arg0() const { return arg0_.empty() ? program_ : arg0_; }
  // Arguments after argv[0].
  const std::vector<std::string>& args() const { return args_; }
  // Empty when the child starts in the caller's working directory.
  const std::string& current_dir() const { return current_dir_; }
  Stdio stdin_mode() const { return stdin_; }
  Stdio stdout_mode() const { return stdout_; }
  Stdio stderr_mode() const { return stderr_; }

 private:
  std::string program_;
  std::string arg0_;
  std::vector<std::string> args_;
  std::string current_dir_;
  Stdio stdin_ = Stdio::Inherit;
  Stdio stdout_ = Stdio::Inherit;
  Stdio stderr_ = Stdio::Inherit;
};

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_COMMAND_H_
