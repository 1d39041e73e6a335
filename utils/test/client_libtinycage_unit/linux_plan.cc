/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <sys/stat.h>
#include <assert.h>

#include "../common/test-helpers.h"

#if defined(__linux__)
#include <sys/mount.h>

#include "linux-backend.h"

using namespace tinycage;

static const LinuxMount* FindBind(const LinuxMountPlan& plan, const std::string& source) {
    for (const LinuxMount& mount : plan.mounts) {
        if (mount.kind == LinuxMount::BIND && mount.source == source) return &mount;
    }
    return nullptr;
}

int main() {
    const std::string dir = MakeTempDir();
    assert(mkdir((dir + "/rw").c_str(), 0755) == 0);
    assert(mkdir((dir + "/rw/ro").c_str(), 0755) == 0);
    WriteTextFile(dir + "/tool", "#!/bin/sh\n");
    assert(symlink("rw", (dir + "/alias").c_str()) == 0);

    Sandbox sandbox;
    sandbox.SetImplicitLibraryReads(false);
    assert(sandbox.AddException(Exception::Write(dir + "/alias")) == 0);
    assert(sandbox.AddException(Exception::Read(dir + "/rw/ro")) == 0);
    assert(sandbox.AddException(Exception::Execute(dir + "/tool")) == 0);
    ResolvedPolicy policy;
    assert(sandbox.ResolvePolicy(&policy) == 0);

    LinuxBackend backend("/staging");
    backend.BuildPlan(policy, dir + "/rw", true);
    const LinuxMountPlan& plan = backend.plan();

    assert(plan.network_isolated);
    assert(plan.remount_root_readonly);
    assert(plan.minimal_dev);
    assert(plan.dev_dir == "/staging/dev");
    assert(plan.proc_dir == "/staging/proc");
    assert(plan.working_dir == dir + "/rw");
    assert(plan.explicit_working_dir);

    const LinuxMount* rw = FindBind(plan, dir + "/rw");
    assert(rw != nullptr);
    assert(rw->target == "/staging" + dir + "/rw");
    assert(rw->is_directory);
    assert(!(rw->flags & MS_RDONLY));
    assert(rw->flags & MS_NOEXEC);
    assert(rw->flags & MS_NOSUID);
    assert(rw->parents.front() == "/staging" + PathAncestors(dir)[1]);

    const LinuxMount* ro = FindBind(plan, dir + "/rw/ro");
    assert(ro != nullptr);
    assert(ro->flags & MS_RDONLY);

    const LinuxMount* tool = FindBind(plan, dir + "/tool");
    assert(tool != nullptr);
    assert(!tool->is_directory);
    assert(tool->flags & MS_RDONLY);
    if (!(RemountFlagsFor(dir, ACCESS_READ | ACCESS_EXECUTE) & MS_NOEXEC)) {
        // Only when /tmp itself is not mounted noexec.
        assert(!(tool->flags & MS_NOEXEC));
    }

    // The shell from the #! line is mounted too.
    assert(FindBind(plan, Canonical(FindOnPath("sh"))) != nullptr);

    bool found_alias = false, found_dev_link = false;
    for (const LinuxSymlink& link : plan.symlinks) {
        if (link.link == "/staging" + dir + "/alias" && link.target == "rw") found_alias = true;
        if (link.link == "/staging/dev/stdout" && link.target == "/proc/self/fd/1") {
            found_dev_link = true;
        }
    }
    assert(found_alias);
    assert(found_dev_link);

    bool has_null = false;
    for (const std::string& node : plan.dev_nodes) {
        if (node == "/dev/null") has_null = true;
    }
    assert(has_null);
    assert(plan.dev_nodes.size() == plan.dev_targets.size());

    // Networking and a writable root change the plan accordingly.
    Sandbox open;
    assert(open.AddException(Exception::Networking()) == 0);
    assert(open.AddException(Exception::Write("/")) == 0);
    ResolvedPolicy open_policy;
    assert(open.ResolvePolicy(&open_policy) == 0);
    LinuxBackend open_backend(dir);
    open_backend.BuildPlan(open_policy, "/", false);
    assert(!open_backend.plan().network_isolated);
    assert(!open_backend.plan().remount_root_readonly);
    assert(!open_backend.plan().minimal_dev);
    const LinuxMount* root = FindBind(open_backend.plan(), "/");
    assert(root != nullptr);
    assert(root->target == dir);
    // The staging directory is hidden again inside the bind of "/".
    assert(root->hide == dir + dir);

    printf("linux_plan passed\n");
    return 0;
}

#else

int main() {
    printf("not a Linux host, skipping\n");
    return TEST_SKIPPED;
}

#endif
