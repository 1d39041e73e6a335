/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/stat.h>
#include <assert.h>

#include "../common/test-helpers.h"

using namespace tinycage;

static ExitStatus RunShell(Sandbox& sandbox, const std::string& sh, const std::string& script,
                           std::string* out) {
    Child child;
    int res = sandbox.Spawn(Command(sh).Arg("-c").Arg(script).Stdout(Stdio::Piped)
                                .Stderr(Stdio::Null), &child);
    if (res < 0) {
        printf("spawn failed: %s\n", TinyCageGetErrorMsg());
        exit(1);
    }
    Output output;
    assert(child.WaitWithOutput(&output) == 0);
    *out = output.stdout_data;
    printf("'%s' -> %s\n", script.c_str(), output.status.ToString().c_str());
    return output.status;
}

int main() {
    SkipUnlessSandboxWorks();
    const std::string sh = FindOnPath("sh");
    const std::string cat = FindOnPath("cat");

    const std::string dir = MakeTempDir();
    const std::string file = dir + "/data.txt";
    WriteTextFile(file, "original\n");
    assert(mkdir((dir + "/out").c_str(), 0755) == 0);
    assert(mkdir((dir + "/out/locked").c_str(), 0755) == 0);

    Sandbox sandbox;
    assert(sandbox.AddException(Exception::Execute(sh)) == 0);
    assert(sandbox.AddException(Exception::Execute(cat)) == 0);
    assert(sandbox.AddException(Exception::Read(file)) == 0);
    assert(sandbox.AddException(Exception::Write(dir + "/out")) == 0);
    assert(sandbox.AddException(Exception::Read(dir + "/out/locked")) == 0);

    std::string out;
    ExitStatus status = RunShell(sandbox, sh, cat + " " + file, &out);
    assert(status.success());
    assert(out == "original\n");

    status = RunShell(sandbox, sh, "echo changed > " + file, &out);
    assert(!status.success());
    assert(ReadTextFile(file) == "original\n");

    // A directory grant covers its subtree, a deeper grant overrides it.
    status = RunShell(sandbox, sh, "echo new > " + dir + "/out/created", &out);
    assert(status.success());
    assert(ReadTextFile(dir + "/out/created") == "new\n");

    status = RunShell(sandbox, sh, "echo new > " + dir + "/out/locked/created", &out);
    assert(!status.success());
    struct stat sb;
    assert(stat((dir + "/out/locked/created").c_str(), &sb) < 0);

    // Nothing outside the grants is visible.
    status = RunShell(sandbox, sh, "echo x > " + dir + "/elsewhere", &out);
    assert(!status.success());
    assert(stat((dir + "/elsewhere").c_str(), &sb) < 0);
    return 0;
}
