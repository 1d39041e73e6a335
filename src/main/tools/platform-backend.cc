/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/platform-backend.h"
#include "src/main/tools/logging.h"

#if defined(__linux__)
#include "src/main/tools/linux-backend.h"
#elif defined(__APPLE__)
#include "src/main/tools/macos-backend.h"
#endif

#include <algorithm>
#include <map>

namespace tinycage {

std::unique_ptr<PlatformBackend> CreatePlatformBackend(const BackendOptions &options) {
#if defined(__linux__)
  return std::unique_ptr<PlatformBackend>(new LinuxBackend(options.staging_dir));
#elif defined(__APPLE__)
  (void)options;
  return std::unique_ptr<PlatformBackend>(new MacosBackend());
#else
  (void)options;
  return nullptr;
#endif
}


std::vector<PolicyEntry> CollectEnforceableEntries(const ResolvedPolicy &policy,
                                                   std::vector<SymlinkAlias> *aliases) {
  std::map<std::string, PolicyEntry> entries;
  PathResolver resolver("/");

  for (const PolicyEntry &entry : policy.entries()) {
    if (!entry.pending) {
      auto found = entries.find(entry.path);
      if (found == entries.end()) {
        entries[entry.path] = entry;
      } else {
        found->second.access |= entry.access;
        found->second.implicit = found->second.implicit && entry.implicit;
      }
      continue;
    }
    ResolvedPath resolved = resolver.Resolve(entry.path);
    if (!resolved.exists) {
      PRINT_DEBUG("%s still does not exist, not granting it", entry.path.c_str());
      continue;
    }
    PRINT_DEBUG("pending %s now resolves to %s", entry.path.c_str(), resolved.path.c_str());
    const bool fresh = entries.find(resolved.path) == entries.end();
    PolicyEntry &realized = entries[resolved.path];
    realized.path = resolved.path;
    realized.access |= entry.access;
    realized.is_directory = resolved.is_directory;
    realized.implicit = fresh ? entry.implicit : (realized.implicit && entry.implicit);
    realized.pending = false;
  }

  if (aliases != nullptr) {
    aliases->insert(aliases->end(), resolver.aliases().begin(), resolver.aliases().end());
    std::sort(aliases->begin(), aliases->end());
    aliases->erase(std::unique(aliases->begin(), aliases->end()), aliases->end());
  }

  std::vector<PolicyEntry> res;
  for (const auto &item : entries) {
    res.push_back(item.second);
  }
  return res;
}

}  // namespace tinycage
