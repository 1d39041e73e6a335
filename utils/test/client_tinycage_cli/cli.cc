/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/wait.h>
#include <assert.h>

#include <vector>

#include "../common/test-helpers.h"

using namespace tinycage;

// Runs the tinycage binary with `args` and returns its exit code.
static int RunCli(const std::string& cli, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(cli.c_str()));
    for (const std::string& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        execv(cli.c_str(), argv.data());
        _exit(99);
    }
    int status;
    assert(waitpid(pid, &status, 0) == pid);
    assert(WIFEXITED(status));
    return WEXITSTATUS(status);
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        printf("usage: %s <path to tinycage>\n", argv[0]);
        return 1;
    }
    const std::string cli = argv[1];

    // Usage errors do not need a working sandbox.
    assert(RunCli(cli, {}) == 2);
    assert(RunCli(cli, {"-q", "--", "true"}) == 2);
    assert(RunCli(cli, {"-r", "", "--", "true"}) == 2);

    SkipUnlessSandboxWorks();
    const std::string true_path = FindOnPath("true");
    const std::string false_path = FindOnPath("false");

    int code = RunCli(cli, {"-x", true_path, "--", true_path});
    printf("allowed true: %d\n", code);
    assert(code == 0);

    code = RunCli(cli, {"-x", false_path, "--", false_path});
    printf("allowed false: %d\n", code);
    assert(code == 1);

    code = RunCli(cli, {"--", true_path});
    printf("denied true: %d\n", code);
    assert(code == 126);

    code = RunCli(cli, {"-x", true_path, "--", "/nonexistent/tinycage-program"});
    printf("missing program: %d\n", code);
    assert(code == 127);
    return 0;
}
