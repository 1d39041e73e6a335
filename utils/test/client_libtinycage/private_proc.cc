/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <errno.h>
#include <fcntl.h>
#include <assert.h>

#if defined(__linux__)
#include <sched.h>
#include <sys/mount.h>
#endif

#include "../common/test-helpers.h"

using namespace tinycage;

#if defined(__linux__)

// The sandboxed process must never see our command line: either it gets a
// proc of its own or the spawn fails.
static void CheckCmdlineHidden(Sandbox& sandbox, const std::string& cat, bool may_fail) {
    const std::string cmdline = "/proc/" + std::to_string(getpid()) + "/cmdline";
    Child child;
    if (sandbox.Spawn(Command(cat).Arg(cmdline).Stdout(Stdio::Piped), &child) < 0) {
        printf("spawn failed: %s\n", TinyCageGetErrorMsg());
        assert(may_fail);
        assert(TinyCageGetErrorCode() == static_cast<int>(ErrorCode::PolicyApplication));
        assert(sandbox.LastSpawnState() == SpawnState::Failed);
        return;
    }
    Output output;
    assert(child.WaitWithOutput(&output) == 0);
    printf("cat %s -> %s, '%s'\n", cmdline.c_str(), output.status.ToString().c_str(),
           output.stdout_data.c_str());
    assert(!output.status.success());
    assert(output.stdout_data.empty());
}


static bool WriteProcFile(const char* path, const std::string& contents) {
    int fd = open(path, O_WRONLY);
    if (fd < 0) return false;
    bool ok = write(fd, contents.data(), contents.size()) == static_cast<ssize_t>(contents.size());
    close(fd);
    return ok;
}


// Moves this process into its own user and mount namespaces and hides part of
// proc under a tmpfs, the way container runtimes mask it.
static bool MaskProc() {
    const unsigned uid = getuid();
    const unsigned gid = getgid();
    if (unshare(CLONE_NEWUSER | CLONE_NEWNS) < 0) {
        printf("unshare: %s\n", strerror(errno));
        return false;
    }
    WriteProcFile("/proc/self/setgroups", "deny");
    if (!WriteProcFile("/proc/self/uid_map", "0 " + std::to_string(uid) + " 1\n") ||
        !WriteProcFile("/proc/self/gid_map", "0 " + std::to_string(gid) + " 1\n")) {
        printf("id maps: %s\n", strerror(errno));
        return false;
    }
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0 ||
        mount("tmpfs", "/proc/sys/fs", "tmpfs", 0, nullptr) < 0) {
        printf("masking proc: %s\n", strerror(errno));
        return false;
    }
    return true;
}

int main() {
    SkipUnlessSandboxWorks();
    const std::string cat = FindOnPath("cat");

    Sandbox sandbox;
    sandbox.SetStagingDirectory(MakeTempDir());
    assert(sandbox.AddException(Exception::Execute(cat)) == 0);

    CheckCmdlineHidden(sandbox, cat, false);

    if (!MaskProc()) {
        return TEST_SKIPPED;
    }
    CheckCmdlineHidden(sandbox, cat, true);
    return 0;
}

#else

int main() {
    printf("private proc only exists on Linux, skipping\n");
    return TEST_SKIPPED;
}

#endif
