/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <unistd.h>
#include <assert.h>

#include "../common/test-helpers.h"

using namespace tinycage;

int main() {
    printf("starting program out of the sandbox pid=%d\n", getpid());

    assert(TinyCageEnableLog("/no/such/directory/tinycage.log") < 0);

    const std::string dir = MakeTempDir();
    assert(TinyCageEnableLog(dir + "/tinycage.log") == 0);
    assert(TinyCageEnableLog(dir + "/other.log") < 0);
    int err_code = TinyCageGetErrorCode();
    assert(err_code == static_cast<int>(ErrorCode::LogFileNotUnique));

    Sandbox sandbox;
    assert(sandbox.AddException(Exception::Read(dir)) == 0);
    fflush(global_debug);
    const std::string log = ReadTextFile(dir + "/tinycage.log");
    assert(log.find("adding exception") != std::string::npos);
    return 0;
}
