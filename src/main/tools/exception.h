/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_EXCEPTION_H_
#define SRC_MAIN_TOOLS_EXCEPTION_H_

#include <map>
#include <string>
#include <vector>

namespace tinycage {

// Access kinds a path grant can carry. Values are OR'ed together; merging two
// grants on one path is the union of their bits.
enum Access : unsigned {
  ACCESS_NONE = 0,
  ACCESS_READ = 1u << 0,
  ACCESS_WRITE = 1u << 1,
  ACCESS_EXECUTE = 1u << 2,
};

// "rwx" style rendering, e.g. "r-x".
std::string AccessToString(unsigned access);

typedef std::map<std::string, std::string> EnvironmentMap;

// A single permission granted to the sandboxed child. Exceptions are purely
// additive: anything not covered by one is denied.
class Exception {
 public:
  enum class Kind {
    Read,
    Write,
    Execute,
    Networking,
    CustomEnvironment,
  };

  // Read access to a file, or to a directory and everything below it.
  static Exception Read(const std::string& path);
  // Write access. Implies read access.
  static Exception Write(const std::string& path);
  // Execute access. Implies read access.
  static Exception Execute(const std::string& path);
  // Allows all network operations.
  static Exception Networking();
  // Replaces the whole environment of the child with `env`.
  static Exception CustomEnvironment(const EnvironmentMap& env);

  Kind kind() const { return kind_; }
  const std::string& path() const { return path_; }
  const EnvironmentMap& environment() const { return environment_; }

  // True for Read, Write and Execute.
  bool IsPathException() const;

  // Access mask carried by a path exception, ACCESS_NONE for the others.
  unsigned access() const;

  std::string ToString() const;

  bool operator==(const Exception& other) const;
  bool operator!=(const Exception& other) const { return !(*this == other); }

 private:
  Exception(Kind kind, const std::string& path, const EnvironmentMap& env);

  Kind kind_;
  std::string path_;
  EnvironmentMap environment_;
};

const char* KindToString(Exception::Kind kind);

// Checks `exception` against the already accepted `existing` ones. Returns 0,
// or reports ErrorCode::Conflict for a second CustomEnvironment and
// ErrorCode::InvalidException for a path that names nothing.
int ValidateException(const Exception& exception, const std::vector<Exception>& existing);

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_EXCEPTION_H_
