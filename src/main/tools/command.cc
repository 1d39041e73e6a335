/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/command.h"

namespace tinycage {

Command::Command(const std::string& program) : program_(program) {}

Command& Command::Arg0(const std::string& name) {
  arg0_ = name;
  return *this;
}

Command& Command::Arg(const std::string& arg) {
  args_.push_back(arg);
  return *this;
}

Command& Command::Args(const std::vector<std::string>& args) {
  args_.insert(args_.end(), args.begin(), args.end());
  return *this;
}

Command& Command::CurrentDir(const std::string& dir) {
  current_dir_ = dir;
  return *this;
}

Command& Command::Stdin(Stdio mode) {
  stdin_ = mode;
  return *this;
}

Command& Command::Stdout(Stdio mode) {
  stdout_ = mode;
  return *this;
}

Command& Command::Stderr(Stdio mode) {
  stderr_ = mode;
  return *this;
}

}  // namespace tinycage
