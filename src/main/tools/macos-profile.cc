/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/macos-profile.h"
#include "src/main/tools/logging.h"

#include <algorithm>
#include <set>

namespace tinycage {

static const char kProfilePreamble[] =
    "(version 1)\n"
    "(deny default)\n"
    "(import \"system.sb\")\n"
    "(allow process-fork)\n"
    "(allow signal (target same-sandbox))\n"
    "(allow sysctl-read)\n"
    "(allow mach-lookup\n"
    "\t(global-name \"com.apple.system.opendirectoryd.libinfo\")\n"
    "\t(global-name \"com.apple.system.notification_center\")\n"
    "\t(global-name \"com.apple.system.logger\"))\n"
    "(allow file-read* file-write-data\n"
    "\t(literal \"/dev/null\")\n"
    "\t(literal \"/dev/zero\"))\n"
    "(allow file-read*\n"
    "\t(literal \"/dev/random\")\n"
    "\t(literal \"/dev/urandom\"))\n";


std::string EscapeProfileString(const std::string& value) {
  std::string res = "\"";
  for (char c : value) {
    if (c == '\\' || c == '"') res += '\\';
    res += c;
  }
  res += '"';
  return res;
}


bool IsRepresentable(const std::string& path) {
  if (path.empty() || path[0] != '/') return false;
  for (unsigned char c : path) {
    if (c < 0x20 || c == 0x7f) return false;
  }
  return true;
}


static std::string Filter(const PolicyEntry& entry) {
  return std::string(entry.is_directory ? "(subpath " : "(literal ") +
         EscapeProfileString(entry.path) + ")";
}


// SBPL operations covering one access bit.
static const char* OperationsFor(unsigned bit) {
  switch (bit) {
    case ACCESS_READ:
      return "file-read*";
    case ACCESS_WRITE:
      return "file-write*";
    case ACCESS_EXECUTE:
      return "process-exec file-map-executable";
  }
  return nullptr;
}


static const PolicyEntry* Parent(const std::vector<const PolicyEntry*>& emitted,
                                 const PolicyEntry& entry) {
  const PolicyEntry* res = nullptr;
  for (const PolicyEntry* candidate : emitted) {
    if (candidate->is_directory && candidate->path != entry.path &&
        IsPathPrefix(candidate->path, entry.path)) {
      if (res == nullptr || candidate->path.size() > res->path.size()) res = candidate;
    }
  }
  return res;
}


std::string SynthesizeProfile(const std::vector<PolicyEntry>& entries,
                              const std::vector<SymlinkAlias>& aliases,
                              bool network_allowed) {
  std::vector<PolicyEntry> sorted;
  for (const PolicyEntry& entry : entries) {
    if (entry.pending) continue;
    if (!IsRepresentable(entry.path)) {
      PRINT_DEBUG("leaving %s out of the profile", entry.path.c_str());
      continue;
    }
    sorted.push_back(entry);
  }
  std::sort(sorted.begin(), sorted.end(), [](const PolicyEntry& a, const PolicyEntry& b) {
    return a.path.size() < b.path.size() || (a.path.size() == b.path.size() && a.path < b.path);
  });

  std::string profile = kProfilePreamble;
  std::set<std::string> metadata;
  std::vector<const PolicyEntry*> emitted;

  for (const PolicyEntry& entry : sorted) {
    const PolicyEntry* parent = Parent(emitted, entry);
    const unsigned inherited = parent == nullptr ? ACCESS_NONE : parent->access;
    const std::string filter = Filter(entry);

    for (unsigned bit : {ACCESS_READ, ACCESS_WRITE, ACCESS_EXECUTE}) {
      if (entry.access & bit) {
        profile += std::string("(allow ") + OperationsFor(bit) + " " + filter + ")\n";
      } else if (inherited & bit) {
        profile += std::string("(deny ") + OperationsFor(bit) + " " + filter + ")\n";
      }
    }
    for (const std::string& ancestor : PathAncestors(entry.path)) {
      metadata.insert(ancestor);
    }
    emitted.push_back(&entry);
  }

  for (const SymlinkAlias& alias : aliases) {
    if (!IsRepresentable(alias.link)) continue;
    metadata.insert(alias.link);
    for (const std::string& ancestor : PathAncestors(alias.link)) {
      metadata.insert(ancestor);
    }
  }

  if (!metadata.empty()) {
    profile += "(allow file-read-metadata\n";
    for (const std::string& path : metadata) {
      profile += "\t(literal " + EscapeProfileString(path) + ")\n";
    }
    profile += ")\n";
  }

  if (network_allowed) {
    profile += "(allow network*)\n";
  }
  return profile;
}

}  // namespace tinycage
