/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/stat.h>
#include <assert.h>

#include <algorithm>

#include "../common/test-helpers.h"
#include "path-resolver.h"
#include "policy.h"

using namespace tinycage;

int main() {
    const std::string dir = MakeTempDir();
    assert(mkdir((dir + "/real").c_str(), 0755) == 0);
    WriteTextFile(dir + "/real/file", "x");
    assert(symlink("real", (dir + "/link").c_str()) == 0);
    assert(symlink((dir + "/link/file").c_str(), (dir + "/abs").c_str()) == 0);
    assert(symlink("loop2", (dir + "/loop1").c_str()) == 0);
    assert(symlink("loop1", (dir + "/loop2").c_str()) == 0);

    PathResolver resolver("/");
    ResolvedPath resolved = resolver.Resolve(dir + "/abs");
    assert(resolved.exists);
    assert(resolved.is_regular);
    assert(resolved.path == dir + "/real/file");
    const std::vector<SymlinkAlias>& aliases = resolver.aliases();
    assert(std::find(aliases.begin(), aliases.end(),
                     SymlinkAlias{dir + "/abs", dir + "/link/file"}) != aliases.end());
    assert(std::find(aliases.begin(), aliases.end(),
                     SymlinkAlias{dir + "/link", "real"}) != aliases.end());

    ResolvedPath loop = resolver.Resolve(dir + "/loop1/x");
    assert(!loop.exists);
    assert(loop.error == ELOOP);

    ResolvedPath through_file = resolver.Resolve(dir + "/real/file/x");
    assert(!through_file.exists);
    assert(through_file.error == ENOTDIR);

    assert(NormalizePath("/a/./b//c/../d/") == "/a/b/d");
    assert(NormalizePath("/../..") == "/");
    assert(IsPathPrefix("/a", "/a/b"));
    assert(!IsPathPrefix("/a", "/ab"));
    assert(IsPathPrefix("/", "/anything"));
    std::vector<std::string> ancestors = PathAncestors("/a/b/c");
    assert(ancestors.size() == 3);
    assert(ancestors[0] == "/" && ancestors[1] == "/a" && ancestors[2] == "/a/b");

    Sandbox sandbox;
    assert(sandbox.AddException(Exception::Read(dir + "/link/file")) == 0);
    ResolvedPolicy policy;
    assert(sandbox.ResolvePolicy(&policy) == 0);
    assert(policy.entries().size() == 1);
    assert(policy.entries()[0].path == dir + "/real/file");
    assert(policy.aliases().size() == 1);
    assert(policy.aliases()[0].link == dir + "/link");

    printf("symlink_alias passed\n");
    return 0;
}
