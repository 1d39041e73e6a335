/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_ERROR_HANDLING_H_
#define SRC_MAIN_TOOLS_ERROR_HANDLING_H_

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

#define MAX_ERR_LEN 255

#define UNRECOVERABLE_FAIL -1
#define RECOVERABLE_FAIL -2
#define RECOVERABLE_ERROR_CODES -200

namespace tinycage {

enum class ErrorCode : int {
  None = 0,
  Conflict = -1,
  InvalidException = -2,
  LogFileNotUnique = -3,
  InvalidArgument = -4,
  ProgramNotFound = -5,
  NotPermitted = -6,
  ProcessCreation = -7,
  PolicyApplication = -8,
  ExecFailed = -9,
  NotSupported = -10,
  ChildError = -11,
  GeneralOSError = -100,
  // Error codes from -201 are recoverables
  PathNotResolved = -201,
  Unknown = -1000
};

inline std::string GetErrorMessage(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return ": No error";
    case ErrorCode::Conflict:
      return " : Conflicting exception. Only one custom environment is allowed";
    case ErrorCode::InvalidException:
      return " : Invalid exception. Paths must be non-empty and cannot contain NUL";
    case ErrorCode::LogFileNotUnique:
      return " : Cannot write debug output to more than one file";
    case ErrorCode::InvalidArgument:
      return " : Invalid argument";
    case ErrorCode::ProgramNotFound:
      return " : Program not found";
    case ErrorCode::NotPermitted:
      return " : Program is not executable under the sandbox policy";
    case ErrorCode::ProcessCreation:
      return " : Could not create the sandboxed process";
    case ErrorCode::PolicyApplication:
      return " : Could not apply the sandbox policy in the child";
    case ErrorCode::ExecFailed:
      return " : Could not execute the target program";
    case ErrorCode::NotSupported:
      return " : Sandboxing is not supported on this system";
    case ErrorCode::ChildError:
      return " : Operation on the child process failed";
    case ErrorCode::GeneralOSError:
      return " : OS Error";
    case ErrorCode::PathNotResolved:
      return " : Path could not be fully resolved";
    case ErrorCode::Unknown:
    default:
      return ": Unknown error occurred";
  }
}

typedef struct {
  char msg[MAX_ERR_LEN];
  ErrorCode code;
  // errno of the failing system call, 0 when the error is not an OS error.
  int os_errno;
} TinyCageError;

#define TinyCageReportError(code) \
    ::tinycage::TinyCageReportError_impl((code), __FILE__, __LINE__, __func__)

int TinyCageReportError_impl(ErrorCode code, const char* file, int line, const char* func);

#define TinyCageReportErrorAndMessage(msg, code) \
    ::tinycage::TinyCageReportErrorAndMessage_impl((msg), (code), 0, __FILE__, __LINE__, __func__)

#define TinyCageReportOSError(msg, code, os_errno) \
    ::tinycage::TinyCageReportErrorAndMessage_impl((msg), (code), (os_errno), __FILE__, __LINE__, __func__)

int TinyCageReportErrorAndMessage_impl(const std::string& err_msg, ErrorCode code, int os_errno,
                                       const char* file, int line, const char* func);

TinyCageError TinyCageGetLastError();
const char* TinyCageGetErrorMsg();
int TinyCageGetErrorCode();
int TinyCageGetErrorErrno();
void TinyCageClearError();

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_ERROR_HANDLING_H_
