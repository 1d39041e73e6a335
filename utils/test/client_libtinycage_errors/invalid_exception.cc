/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>

#include "tinycage-api.h"

using namespace tinycage;

static void ExpectInvalid(Sandbox& sandbox, const Exception& exception) {
    int res = sandbox.AddException(exception);
    assert(res < 0);
    assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::InvalidException));
    printf("rejected %s: %s\n", exception.ToString().c_str(), TinyCageGetErrorMsg());
}

int main() {
    Sandbox sandbox;
    ExpectInvalid(sandbox, Exception::Read(""));
    ExpectInvalid(sandbox, Exception::Write(std::string("/tmp/a\0b", 8)));
    ExpectInvalid(sandbox, Exception::CustomEnvironment({{"", "x"}}));
    ExpectInvalid(sandbox, Exception::CustomEnvironment({{"A=B", "x"}}));
    assert(sandbox.exceptions().empty());

    // Paths are taken as given, relative or not existing.
    assert(sandbox.AddException(Exception::Read("relative/../path")) == 0);
    assert(sandbox.AddException(Exception::Execute("/does/not/exist")) == 0);
    TinyCageClearError();
    assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::None));
    return 0;
}
