/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <stdlib.h>
#include <assert.h>

#include "../common/test-helpers.h"

using namespace tinycage;

static std::string RunEnv(Sandbox& sandbox, const std::string& program) {
    Child child;
    if (sandbox.Spawn(Command(program).Stdout(Stdio::Piped), &child) < 0) {
        printf("spawn failed: %s\n", TinyCageGetErrorMsg());
        exit(1);
    }
    Output output;
    assert(child.WaitWithOutput(&output) == 0);
    assert(output.status.success());
    return output.stdout_data;
}

int main() {
    SkipUnlessSandboxWorks();
    const std::string env = FindOnPath("env");
    setenv("TINYCAGE_TEST_MARKER", "inherited", 1);

    // Without a custom environment the caller's is inherited whole.
    Sandbox inheriting;
    assert(inheriting.AddException(Exception::Execute(env)) == 0);
    std::string out = RunEnv(inheriting, env);
    assert(out.find("TINYCAGE_TEST_MARKER=inherited\n") != std::string::npos);

    // With one the child sees exactly that, and the program is looked up in
    // its PATH.
    Sandbox sandbox;
    assert(sandbox.AddException(Exception::Execute(env)) == 0);
    assert(sandbox.AddException(Exception::CustomEnvironment({{"PATH", "/usr/bin:/bin"}})) == 0);
    out = RunEnv(sandbox, "env");
    printf("child environment: '%s'\n", out.c_str());
    assert(out == "PATH=/usr/bin:/bin\n");

    Sandbox empty;
    assert(empty.AddException(Exception::Execute(env)) == 0);
    assert(empty.AddException(Exception::CustomEnvironment({})) == 0);
    assert(RunEnv(empty, env).empty());
    return 0;
}
