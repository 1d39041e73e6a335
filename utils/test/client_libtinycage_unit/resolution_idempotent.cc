/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/stat.h>
#include <assert.h>

#include "../common/test-helpers.h"
#include "policy.h"

using namespace tinycage;

int main() {
    const std::string dir = MakeTempDir();
    assert(mkdir((dir + "/a").c_str(), 0755) == 0);
    WriteTextFile(dir + "/a/script", "#!/bin/sh\n");
    assert(symlink("a", (dir + "/link").c_str()) == 0);

    // Relative paths are anchored at the working directory.
    assert(chdir(dir.c_str()) == 0);

    Sandbox sandbox;
    assert(sandbox.AddException(Exception::Read("a/../a")) == 0);
    assert(sandbox.AddException(Exception::Execute(dir + "/link/script")) == 0);
    assert(sandbox.AddException(Exception::Write("./not-yet")) == 0);
    assert(sandbox.AddException(Exception::Networking()) == 0);
    assert(sandbox.AddException(Exception::CustomEnvironment({{"PATH", "/usr/bin:/bin"}})) == 0);

    ResolvedPolicy first, second;
    assert(sandbox.ResolvePolicy(&first) == 0);
    assert(sandbox.ResolvePolicy(&second) == 0);
    assert(first == second);

    assert(first.FindEntry(dir + "/a") != nullptr);
    assert(first.Allows(dir + "/a/script", ACCESS_EXECUTE));
    assert(first.network_allowed());
    assert(first.has_custom_environment());
    assert(first.environment().size() == 1);

    // Resolution is read-only: the pending path was not created.
    struct stat sb;
    assert(stat((dir + "/not-yet").c_str(), &sb) < 0);
    assert(sandbox.LastWarnings().size() == 1);

    // Once the filesystem changes, so does the policy.
    WriteTextFile(dir + "/not-yet", "");
    ResolvedPolicy third;
    assert(sandbox.ResolvePolicy(&third) == 0);
    assert(third != first);
    assert(sandbox.LastWarnings().empty());

    printf("resolution_idempotent passed\n");
    return 0;
}
