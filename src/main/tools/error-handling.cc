/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */


#include "src/main/tools/error-handling.h"
#include "src/main/tools/logging.h"

namespace tinycage {

// Each thread spawning children keeps its own record.
static thread_local TinyCageError sbx_err = {{0}, ErrorCode::None, 0};


static void GenErrorMessage(const std::string& err_msg, const char* file,
                                          int line, const char* func, std::string& out) {
  out = "[" + std::string(func) + ":" + std::to_string(line) + "]: "  + err_msg;
}


static bool IsRecoverable(ErrorCode code) {
  const int value = static_cast<int>(code);
  return value < RECOVERABLE_ERROR_CODES && code != ErrorCode::Unknown;
}


static void TinyCageSetError(const std::string& err_msg, ErrorCode code, int os_errno, int& ret) {
  memset(sbx_err.msg, 0, MAX_ERR_LEN);
  strncpy(sbx_err.msg, err_msg.c_str(), MAX_ERR_LEN - 1);
  sbx_err.msg[MAX_ERR_LEN - 1] = '\0';
  sbx_err.code = code;
  sbx_err.os_errno = os_errno;

  if (IsRecoverable(code))
    ret = RECOVERABLE_FAIL;
  else
    ret = UNRECOVERABLE_FAIL;
}


int TinyCageReportError_impl(ErrorCode code, const char* file, int line, const char* func) {
  return TinyCageReportErrorAndMessage_impl("", code, 0, file, line, func);
}


int TinyCageReportErrorAndMessage_impl(const std::string& err_msg, ErrorCode code, int os_errno,
                                       const char* file, int line, const char* func) {
  std::string msg;
  std::string code_msg;
  int ret = 0;

  code_msg = GetErrorMessage(code);
  if (!err_msg.empty())
    code_msg += ": " + err_msg;
  if (os_errno != 0)
    code_msg += std::string(" (") + strerror(os_errno) + ")";

  GenErrorMessage(code_msg, file, line, func, msg);
  PRINT_DEBUG("error %d reported from %s: %s", static_cast<int>(code), file, msg.c_str());
  TinyCageSetError(msg, code, os_errno, ret);
  return ret;
}


TinyCageError TinyCageGetLastError() {
  return sbx_err;
}


const char* TinyCageGetErrorMsg() {
  return sbx_err.msg;
}


int TinyCageGetErrorCode() {
  return static_cast<int>(sbx_err.code);
}


int TinyCageGetErrorErrno() {
  return sbx_err.os_errno;
}


void TinyCageClearError() {
  memset(sbx_err.msg, 0, MAX_ERR_LEN);
  sbx_err.code = ErrorCode::None;
  sbx_err.os_errno = 0;
}

}  // namespace tinycage
