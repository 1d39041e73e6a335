/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/stat.h>
#include <assert.h>

#include "../common/test-helpers.h"
#include "platform-backend.h"
#include "policy.h"

using namespace tinycage;

int main() {
    const std::string dir = MakeTempDir();
    assert(symlink(dir.c_str(), (dir + "/self").c_str()) == 0);

    Sandbox sandbox;
    assert(sandbox.AddException(Exception::Write(dir + "/self/out/../out/log.txt")) == 0);
    assert(sandbox.AddException(Exception::Read(dir + "/present")) == 0);
    WriteTextFile(dir + "/present", "here");

    ResolvedPolicy policy;
    assert(sandbox.ResolvePolicy(&policy) == 0);
    printf("%s", policy.ToString().c_str());

    // The existing prefix is canonical, the rest is normalized lexically.
    const PolicyEntry* pending = policy.FindEntry(dir + "/out/log.txt");
    assert(pending != nullptr);
    assert(pending->pending);
    assert(pending->access == (ACCESS_READ | ACCESS_WRITE));
    assert(policy.warnings().size() == 1);
    assert(policy.warnings()[0].os_errno == ENOENT);
    assert(policy.warnings()[0].code == ErrorCode::PathNotResolved);
    assert(policy.warnings()[0].path == dir + "/self/out/../out/log.txt");

    const PolicyEntry* present = policy.FindEntry(dir + "/present");
    assert(present != nullptr && !present->pending);

    // Still missing at enforcement time: left out.
    std::vector<SymlinkAlias> aliases;
    std::vector<PolicyEntry> enforceable = CollectEnforceableEntries(policy, &aliases);
    assert(enforceable.size() == 1);
    assert(enforceable[0].path == dir + "/present");

    // Appeared in the meantime: enforced on its canonical path.
    assert(mkdir((dir + "/out").c_str(), 0755) == 0);
    WriteTextFile(dir + "/out/log.txt", "");
    enforceable = CollectEnforceableEntries(policy, &aliases);
    assert(enforceable.size() == 2);
    assert(enforceable[0].path == dir + "/out/log.txt");
    assert(!enforceable[0].pending);
    assert(!enforceable[0].is_directory);
    assert(enforceable[0].access == (ACCESS_READ | ACCESS_WRITE));

    printf("pending_path passed\n");
    return 0;
}
