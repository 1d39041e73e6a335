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

static bool HasImplicitDirectory(const ResolvedPolicy& policy) {
    for (const PolicyEntry& entry : policy.entries()) {
        if (entry.implicit && entry.is_directory) return true;
    }
    return false;
}

int main() {
    const std::string dir = MakeTempDir();
    const std::string sh = Canonical(FindOnPath("sh"));
    const std::string env = Canonical("/usr/bin/env");

    WriteTextFile(dir + "/direct.sh", "#!/bin/sh\necho direct\n");
    WriteTextFile(dir + "/via-env.sh", "#!/usr/bin/env sh\necho env\n");
    // Each script names the next one as its interpreter.
    WriteTextFile(dir + "/hop1", "#!" + dir + "/hop2\n");
    WriteTextFile(dir + "/hop2", "#!/bin/sh\n");
    WriteTextFile(dir + "/data.txt", "no interpreter here\n");

    {
        Sandbox sandbox;
        assert(sandbox.AddException(Exception::Execute(dir + "/direct.sh")) == 0);
        ResolvedPolicy policy;
        assert(sandbox.ResolvePolicy(&policy) == 0);
        printf("%s", policy.ToString().c_str());
        assert(policy.Allows(dir + "/direct.sh", ACCESS_READ | ACCESS_EXECUTE));
        assert(policy.Allows(sh, ACCESS_READ | ACCESS_EXECUTE));
        const PolicyEntry* interpreter = policy.GoverningEntry(sh);
        assert(interpreter != nullptr);
        assert(HasImplicitDirectory(policy));
    }

    {
        Sandbox sandbox;
        assert(sandbox.AddException(Exception::Execute(dir + "/via-env.sh")) == 0);
        ResolvedPolicy policy;
        assert(sandbox.ResolvePolicy(&policy) == 0);
        assert(policy.Allows(env, ACCESS_EXECUTE));
        assert(policy.Allows(sh, ACCESS_EXECUTE));
    }

    {
        Sandbox sandbox;
        assert(sandbox.AddException(Exception::Execute(dir + "/hop1")) == 0);
        ResolvedPolicy policy;
        assert(sandbox.ResolvePolicy(&policy) == 0);
        assert(policy.Allows(dir + "/hop2", ACCESS_EXECUTE));
        assert(policy.Allows(sh, ACCESS_EXECUTE));
    }

    {
        // Library roots only come with something executable.
        Sandbox sandbox;
        assert(sandbox.AddException(Exception::Read(dir + "/data.txt")) == 0);
        ResolvedPolicy policy;
        assert(sandbox.ResolvePolicy(&policy) == 0);
        assert(policy.entries().size() == 1);
        assert(!HasImplicitDirectory(policy));
    }

    {
        Sandbox sandbox;
        sandbox.SetImplicitLibraryReads(false);
        assert(sandbox.AddException(Exception::Execute(dir + "/data.txt")) == 0);
        ResolvedPolicy policy;
        assert(sandbox.ResolvePolicy(&policy) == 0);
        assert(policy.entries().size() == 1);
        assert(policy.entries()[0].path == dir + "/data.txt");
        assert(policy.entries()[0].access == (ACCESS_READ | ACCESS_EXECUTE));
    }

    printf("execute_closure passed\n");
    return 0;
}
