/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/exception.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

namespace tinycage {

std::string AccessToString(unsigned access) {
  std::string res = "---";
  if (access & ACCESS_READ) res[0] = 'r';
  if (access & ACCESS_WRITE) res[1] = 'w';
  if (access & ACCESS_EXECUTE) res[2] = 'x';
  return res;
}


const char* KindToString(Exception::Kind kind) {
  switch (kind) {
    case Exception::Kind::Read:
      return "Read";
    case Exception::Kind::Write:
      return "Write";
    case Exception::Kind::Execute:
      return "Execute";
    case Exception::Kind::Networking:
      return "Networking";
    case Exception::Kind::CustomEnvironment:
      return "CustomEnvironment";
  }
  return "Unknown";
}


Exception::Exception(Kind kind, const std::string& path, const EnvironmentMap& env)
    : kind_(kind), path_(path), environment_(env) {}

Exception Exception::Read(const std::string& path) {
  return Exception(Kind::Read, path, EnvironmentMap());
}

Exception Exception::Write(const std::string& path) {
  return Exception(Kind::Write, path, EnvironmentMap());
}

Exception Exception::Execute(const std::string& path) {
  return Exception(Kind::Execute, path, EnvironmentMap());
}

Exception Exception::Networking() {
  return Exception(Kind::Networking, "", EnvironmentMap());
}

Exception Exception::CustomEnvironment(const EnvironmentMap& env) {
  return Exception(Kind::CustomEnvironment, "", env);
}


bool Exception::IsPathException() const {
  return kind_ == Kind::Read || kind_ == Kind::Write || kind_ == Kind::Execute;
}


unsigned Exception::access() const {
  switch (kind_) {
    case Kind::Read:
      return ACCESS_READ;
    case Kind::Write:
      return ACCESS_READ | ACCESS_WRITE;
    case Kind::Execute:
      return ACCESS_READ | ACCESS_EXECUTE;
    default:
      return ACCESS_NONE;
  }
}


std::string Exception::ToString() const {
  std::string res = KindToString(kind_);
  if (IsPathException()) {
    res += "(" + path_ + ")";
  } else if (kind_ == Kind::CustomEnvironment) {
    res += "(" + std::to_string(environment_.size()) + " variables)";
  }
  return res;
}


bool Exception::operator==(const Exception& other) const {
  return kind_ == other.kind_ && path_ == other.path_ && environment_ == other.environment_;
}


int ValidateException(const Exception& exception, const std::vector<Exception>& existing) {
  if (exception.IsPathException()) {
    if (exception.path().empty()) {
      return TinyCageReportErrorAndMessage(exception.ToString(), ErrorCode::InvalidException);
    }
    if (exception.path().find('\0') != std::string::npos) {
      return TinyCageReportErrorAndMessage(KindToString(exception.kind()),
                                           ErrorCode::InvalidException);
    }
    return 0;
  }

  if (exception.kind() == Exception::Kind::CustomEnvironment) {
    for (const auto& item : exception.environment()) {
      if (item.first.empty() || item.first.find('=') != std::string::npos ||
          item.first.find('\0') != std::string::npos ||
          item.second.find('\0') != std::string::npos) {
        return TinyCageReportErrorAndMessage("bad environment variable name '" + item.first + "'",
                                             ErrorCode::InvalidException);
      }
    }
    for (const auto& prev : existing) {
      if (prev.kind() == Exception::Kind::CustomEnvironment) {
        PRINT_DEBUG("rejecting second CustomEnvironment exception");
        return TinyCageReportError(ErrorCode::Conflict);
      }
    }
  }
  return 0;
}

}  // namespace tinycage
