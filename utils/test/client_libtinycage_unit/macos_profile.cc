/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <stdio.h>
#include <assert.h>

#include <string>
#include <vector>

#include "macos-profile.h"

using namespace tinycage;

static PolicyEntry Entry(const std::string& path, unsigned access, bool is_directory) {
    PolicyEntry entry;
    entry.path = path;
    entry.access = access;
    entry.is_directory = is_directory;
    return entry;
}

static bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

int main() {
    assert(EscapeProfileString("/plain") == "\"/plain\"");
    assert(EscapeProfileString("/a\"b\\c") == "\"/a\\\"b\\\\c\"");
    assert(IsRepresentable("/ok/path with spaces"));
    assert(!IsRepresentable("relative"));
    assert(!IsRepresentable(""));
    assert(!IsRepresentable("/new\nline"));

    std::vector<PolicyEntry> entries;
    // Deliberately out of order, the profile sorts shallow first.
    entries.push_back(Entry("/data/ro", ACCESS_READ, true));
    entries.push_back(Entry("/data", ACCESS_READ | ACCESS_WRITE, true));
    entries.push_back(Entry("/data/ro/tool", ACCESS_READ | ACCESS_EXECUTE, false));
    entries.push_back(Entry("/odd\"name", ACCESS_READ, false));
    entries.push_back(Entry("/bad\tname", ACCESS_READ, false));
    PolicyEntry pending = Entry("/not/there/yet", ACCESS_READ | ACCESS_WRITE, false);
    pending.pending = true;
    entries.push_back(pending);

    std::vector<SymlinkAlias> aliases;
    aliases.push_back(SymlinkAlias{"/shortcut", "data"});

    const std::string profile = SynthesizeProfile(entries, aliases, false);
    printf("%s", profile.c_str());

    assert(profile.compare(0, 12, "(version 1)\n") == 0);
    assert(Contains(profile, "(deny default)"));
    assert(Contains(profile, "(import \"system.sb\")"));
    assert(Contains(profile, "(allow file-read* (subpath \"/data\"))"));
    assert(Contains(profile, "(allow file-write* (subpath \"/data\"))"));
    assert(Contains(profile, "(allow file-read* (subpath \"/data/ro\"))"));
    assert(Contains(profile, "(deny file-write* (subpath \"/data/ro\"))"));
    assert(Contains(profile, "(allow process-exec file-map-executable (literal \"/data/ro/tool\"))"));
    assert(Contains(profile, "(allow file-read* (literal \"/odd\\\"name\"))"));
    assert(!Contains(profile, "bad\tname"));
    assert(!Contains(profile, "/not/there/yet"));
    assert(!Contains(profile, "network"));

    // The deeper rule comes later so it takes precedence.
    assert(profile.find("(allow file-write* (subpath \"/data\"))") <
           profile.find("(deny file-write* (subpath \"/data/ro\"))"));

    // Ancestors and aliases can be stat'ed.
    assert(Contains(profile, "(allow file-read-metadata\n"));
    assert(Contains(profile, "\t(literal \"/\")\n"));
    assert(Contains(profile, "\t(literal \"/data/ro\")\n"));
    assert(Contains(profile, "\t(literal \"/shortcut\")\n"));

    const std::string networked = SynthesizeProfile(entries, aliases, true);
    assert(Contains(networked, "(allow network*)"));

    const std::string empty = SynthesizeProfile({}, {}, false);
    assert(!Contains(empty, "subpath"));
    assert(!Contains(empty, "file-read-metadata"));

    printf("macos_profile passed\n");
    return 0;
}
