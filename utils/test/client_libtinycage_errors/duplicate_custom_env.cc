/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>

#include "tinycage-api.h"

using namespace tinycage;

int main() {
    Sandbox sandbox;
    assert(sandbox.AddException(Exception::CustomEnvironment({{"PATH", "/usr/bin:/bin"}})) == 0);
    assert(sandbox.AddException(Exception::Read("/etc")) == 0);
    assert(sandbox.AddException(Exception::Read("/etc")) == 0);
    assert(sandbox.AddException(Exception::Networking()) == 0);

    int res = sandbox.AddException(Exception::CustomEnvironment({{"HOME", "/"}}));
    assert(res < 0);
    assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::Conflict));
    printf("second environment rejected: %s\n", TinyCageGetErrorMsg());

    // Even an identical one is a conflict, and the first one is kept.
    assert(sandbox.AddException(Exception::CustomEnvironment({{"PATH", "/usr/bin:/bin"}})) < 0);
    size_t environments = 0;
    for (const Exception& exception : sandbox.exceptions()) {
        if (exception.kind() == Exception::Kind::CustomEnvironment) {
            ++environments;
            assert(exception.environment().at("PATH") == "/usr/bin:/bin");
        }
    }
    assert(environments == 1);
    assert(sandbox.exceptions().size() == 4);
    return 0;
}
