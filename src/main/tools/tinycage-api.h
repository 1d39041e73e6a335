/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

// This header contains the APIs for C++ only and thus we can
// use std::string and the standard containers

#ifndef SRC_MAIN_TOOLS_TINYCAGE_API_H_
#define SRC_MAIN_TOOLS_TINYCAGE_API_H_

#include "src/main/tools/child.h"
#include "src/main/tools/command.h"
#include "src/main/tools/error-handling.h"
#include "src/main/tools/exception.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/sandbox.h"

#endif  // SRC_MAIN_TOOLS_TINYCAGE_API_H_
