/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <errno.h>
#include <assert.h>

#include "../common/test-helpers.h"

using namespace tinycage;

int main() {
    const std::string echo = FindOnPath("echo");

    // Zero exceptions: not even the program itself.
    Sandbox sandbox;
    Child child;
    assert(sandbox.Spawn(Command("echo").Arg("hi"), &child) < 0);
    assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::NotPermitted));
    assert(TinyCageGetErrorErrno() == EACCES);
    assert(!child.valid());
    printf("denied: %s\n", TinyCageGetErrorMsg());

    // Reading a binary does not allow running it.
    assert(sandbox.AddException(Exception::Read(echo)) == 0);
    assert(sandbox.Spawn(Command(echo), &child) < 0);
    assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::NotPermitted));

    assert(sandbox.Spawn(Command("tinycage-no-such-program"), &child) < 0);
    assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::ProgramNotFound));
    assert(TinyCageGetErrorErrno() == ENOENT);

    assert(sandbox.Spawn(Command("/no/such/dir/program"), &child) < 0);
    assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::ProgramNotFound));

    // The launcher never got as far as creating a process.
    assert(sandbox.LastSpawnState() == SpawnState::Created);
    return 0;
}
