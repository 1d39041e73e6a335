/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#ifndef UTILS_TEST_COMMON_TEST_HELPERS_H_
#define UTILS_TEST_COMMON_TEST_HELPERS_H_

#include <assert.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "tinycage-api.h"
#include "path-resolver.h"
#include "process-tools.h"

// CTest treats this exit code as a skipped test.
#define TEST_SKIPPED 77

// Fresh directory under /tmp, symlinks resolved (/tmp is a link on macOS).
static inline std::string MakeTempDir() {
    char tmpl[] = "/tmp/tinycage-test-XXXXXX";
    char* dir = mkdtemp(tmpl);
    assert(dir != nullptr);
    char real[PATH_MAX];
    assert(realpath(dir, real) != nullptr);
    return std::string(real);
}

static inline void WriteTextFile(const std::string& path, const std::string& contents) {
    FILE* f = fopen(path.c_str(), "w");
    assert(f != nullptr);
    fputs(contents.c_str(), f);
    fclose(f);
}

static inline std::string ReadTextFile(const std::string& path) {
    std::string res;
    FILE* f = fopen(path.c_str(), "r");
    if (f == nullptr) return res;
    char buf[512];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) res.append(buf, n);
    fclose(f);
    return res;
}

static inline std::string Canonical(const std::string& path) {
    char real[PATH_MAX];
    assert(realpath(path.c_str(), real) != nullptr);
    return std::string(real);
}

// Host location of a program, as the sandbox would find it in PATH.
static inline std::string FindOnPath(const std::string& name) {
    const char* path = getenv("PATH");
    std::string found;
    int err = tinycage::PathResolver::FindProgram(name, path ? path : "/bin:/usr/bin", &found);
    if (err != 0) {
        printf("%s is not installed, skipping\n", name.c_str());
        exit(TEST_SKIPPED);
    }
    return found;
}

// Exits with TEST_SKIPPED unless a trivial program can be started in a
// sandbox on this machine. Containers often refuse user namespaces or the
// mounts the Linux backend needs.
static inline void SkipUnlessSandboxWorks() {
#if defined(__linux__)
    if (!tinycage::UserNamespaceSupported()) {
        printf("user namespaces unavailable, skipping\n");
        exit(TEST_SKIPPED);
    }
#endif
    const std::string true_path = FindOnPath("true");
    tinycage::Sandbox sandbox;
    assert(sandbox.AddException(tinycage::Exception::Execute(true_path)) == 0);
    tinycage::Child child;
    if (sandbox.Spawn(tinycage::Command(true_path), &child) < 0) {
        printf("sandbox probe failed, skipping: %s\n", tinycage::TinyCageGetErrorMsg());
        exit(TEST_SKIPPED);
    }
    tinycage::ExitStatus status;
    assert(child.Wait(&status) == 0);
    if (!status.success()) {
        printf("sandbox probe exited with %s, skipping\n", status.ToString().c_str());
        exit(TEST_SKIPPED);
    }
}

#endif  // UTILS_TEST_COMMON_TEST_HELPERS_H_
