/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <signal.h>
#include <sys/stat.h>
#include <assert.h>

#include <utility>

#include "../common/test-helpers.h"

using namespace tinycage;

int main() {
    SkipUnlessSandboxWorks();
    const std::string echo = FindOnPath("echo");
    const std::string sleep_path = FindOnPath("sleep");
    const std::string pwd = FindOnPath("pwd");

    Sandbox sandbox;
    assert(sandbox.AddException(Exception::Execute(echo)) == 0);
    assert(sandbox.AddException(Exception::Execute(sleep_path)) == 0);

    ResolvedPolicy before;
    assert(sandbox.ResolvePolicy(&before) == 0);

    for (int i = 0; i < 3; ++i) {
        Child child;
        assert(sandbox.Spawn(Command(echo).Arg(std::to_string(i)).Stdout(Stdio::Piped), &child) == 0);
        Output output;
        assert(child.WaitWithOutput(&output) == 0);
        assert(output.status.success());
        assert(output.stdout_data == std::to_string(i) + "\n");
    }

    ResolvedPolicy after;
    assert(sandbox.ResolvePolicy(&after) == 0);
    assert(before == after);

    // Cancellation goes through the handle.
    Child sleeper;
    assert(sandbox.Spawn(Command(sleep_path).Arg("30"), &sleeper) == 0);
    Child moved(std::move(sleeper));
    assert(!sleeper.valid());
    ExitStatus status;
    bool done = true;
    assert(moved.TryWait(&status, &done) == 0);
    assert(!done);
    assert(moved.Signal(SIGTERM) == 0);
    assert(moved.Wait(&status) == 0);
    printf("sleeper ended with %s\n", status.ToString().c_str());
    assert(!status.success());
    assert(status.ShellCode() == 128 + SIGTERM);

    const std::string dir = MakeTempDir();
    assert(sandbox.AddException(Exception::Execute(pwd)) == 0);
#if defined(__linux__)
    // An explicit working directory must exist inside the private root.
    Child lost;
    assert(sandbox.Spawn(Command(pwd).CurrentDir(dir), &lost) < 0);
    assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::PolicyApplication) ||
           TinyCageGetErrorCode() == static_cast<int>(ErrorCode::ExecFailed));
    assert(sandbox.LastSpawnState() == SpawnState::Failed);
#endif

    assert(sandbox.AddException(Exception::Read(dir)) == 0);
    Child found;
    assert(sandbox.Spawn(Command(pwd).CurrentDir(dir).Stdout(Stdio::Piped), &found) == 0);
    Output output;
    assert(found.WaitWithOutput(&output) == 0);
    assert(output.status.success());
    assert(output.stdout_data == dir + "\n");
    return 0;
}
