/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/policy.h"
#include "src/main/tools/logging.h"
#include "src/main/tools/process-tools.h"

#include <string.h>

#include <algorithm>

namespace tinycage {

template <typename Lookup>
static const PolicyEntry* LongestPrefix(const std::string& path, Lookup lookup) {
  const PolicyEntry* entry = lookup(path);
  if (entry != nullptr) return entry;
  std::vector<std::string> ancestors = PathAncestors(path);
  for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
    entry = lookup(*it);
    if (entry != nullptr && entry->is_directory) return entry;
  }
  return nullptr;
}


const PolicyEntry* ResolvedPolicy::FindEntry(const std::string& path) const {
  auto it = std::lower_bound(entries_.begin(), entries_.end(), path,
                             [](const PolicyEntry& e, const std::string& p) { return e.path < p; });
  if (it != entries_.end() && it->path == path) return &*it;
  return nullptr;
}


const PolicyEntry* ResolvedPolicy::GoverningEntry(const std::string& path) const {
  return LongestPrefix(path, [this](const std::string& p) { return FindEntry(p); });
}


unsigned ResolvedPolicy::AccessFor(const std::string& path) const {
  const PolicyEntry* entry = GoverningEntry(path);
  return entry == nullptr ? ACCESS_NONE : entry->access;
}


bool ResolvedPolicy::Allows(const std::string& path, unsigned access) const {
  return (AccessFor(path) & access) == access;
}


std::string ResolvedPolicy::ToString() const {
  std::string res;
  for (const PolicyEntry& entry : entries_) {
    res += AccessToString(entry.access) + " " + entry.path;
    if (entry.is_directory) res += "/";
    if (entry.pending) res += " (pending)";
    if (entry.implicit) res += " (implicit)";
    res += "\n";
  }
  for (const SymlinkAlias& alias : aliases_) {
    res += "alias " + alias.link + " -> " + alias.target + "\n";
  }
  res += network_allowed_ ? "network allowed\n" : "network denied\n";
  if (has_custom_environment_) {
    res += "custom environment with " + std::to_string(environment_.size()) + " variables\n";
  }
  return res;
}


bool ResolvedPolicy::operator==(const ResolvedPolicy& other) const {
  return entries_ == other.entries_ && aliases_ == other.aliases_ &&
         network_allowed_ == other.network_allowed_ &&
         has_custom_environment_ == other.has_custom_environment_ &&
         environment_ == other.environment_;
}


PolicyBuilder::PolicyBuilder(const PolicyOptions& options)
    : options_(options), resolver_(options.cwd) {}


void PolicyBuilder::AddWarning(const std::string& path, const ResolvedPath& resolved) {
  ResolutionWarning warning;
  warning.path = path;
  warning.resolved = resolved.path;
  warning.os_errno = resolved.error;
  warning.message = strerror(resolved.error);
  PRINT_DEBUG("could not resolve %s (stopped at %s): %s", path.c_str(), resolved.path.c_str(),
              warning.message.c_str());
  warnings_.push_back(warning);
}


void PolicyBuilder::AddExplicit(const Exception& exception) {
  ResolvedPath resolved = resolver_.Resolve(exception.path());
  if (!resolved.exists) {
    AddWarning(exception.path(), resolved);
  }

  PolicyEntry& entry = explicit_[resolved.path];
  entry.path = resolved.path;
  entry.access |= exception.access();
  entry.is_directory = entry.is_directory || resolved.is_directory;
  entry.pending = !resolved.exists;
  PRINT_DEBUG("%s resolved to %s %s", exception.ToString().c_str(), resolved.path.c_str(),
              AccessToString(entry.access).c_str());
}


void PolicyBuilder::AddImplicit(const ResolvedPath& resolved, unsigned access) {
  PolicyEntry& entry = implicit_[resolved.path];
  entry.path = resolved.path;
  entry.access |= access;
  entry.is_directory = resolved.is_directory;
  entry.pending = !resolved.exists;
  entry.implicit = true;
}


void PolicyBuilder::AddExecuteClosure(const std::string& binary, int depth) {
  if (depth >= MAX_INTERPRETER_DEPTH) {
    PRINT_DEBUG("interpreter chain of %s is too deep, stopping", binary.c_str());
    return;
  }

  std::string interpreter, argument;
  if (!PathResolver::ReadInterpreter(binary, &interpreter, &argument)) {
    return;
  }

  ResolvedPath resolved = resolver_.Resolve(interpreter);
  if (!resolved.exists) {
    AddWarning(interpreter, resolved);
    return;
  }
  PRINT_DEBUG("%s is interpreted by %s", binary.c_str(), resolved.path.c_str());
  AddImplicit(resolved, ACCESS_READ | ACCESS_EXECUTE);
  AddExecuteClosure(resolved.path, depth + 1);

  // "#!/usr/bin/env NAME" runs NAME from the search path.
  if (fs::path(resolved.path).filename() != "env" || argument.empty()) {
    return;
  }
  std::string name;
  size_t pos = 0;
  while (pos < argument.size()) {
    size_t end = argument.find_first_of(" \t", pos);
    std::string token = argument.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    pos = (end == std::string::npos) ? argument.size() : end + 1;
    if (!token.empty() && token[0] != '-' && token.find('=') == std::string::npos) {
      name = token;
      break;
    }
  }
  if (name.empty()) {
    return;
  }

  std::string program;
  int err = PathResolver::FindProgram(name, options_.search_path, &program);
  if (err != 0) {
    ResolvedPath missing;
    missing.path = name;
    missing.error = err;
    AddWarning(name, missing);
    return;
  }
  ResolvedPath target = resolver_.Resolve(program);
  if (!target.exists) {
    AddWarning(program, target);
    return;
  }
  AddImplicit(target, ACCESS_READ | ACCESS_EXECUTE);
  AddExecuteClosure(target.path, depth + 1);
}


void PolicyBuilder::AddLibraryRoots() {
  for (const std::string& root : PathResolver::LibraryRoots()) {
    ResolvedPath resolved = resolver_.Resolve(root);
    if (!resolved.exists) {
      continue;
    }
    // Shared objects are mapped executable, so read alone is not enough.
    AddImplicit(resolved, ACCESS_READ | ACCESS_EXECUTE);
  }
}


void PolicyBuilder::Merge(ResolvedPolicy* policy) {
  auto explicit_lookup = [this](const std::string& p) -> const PolicyEntry* {
    auto it = explicit_.find(p);
    return it == explicit_.end() ? nullptr : &it->second;
  };
  auto implicit_lookup = [this](const std::string& p) -> const PolicyEntry* {
    auto it = implicit_.find(p);
    return it == implicit_.end() ? nullptr : &it->second;
  };

  EntryMap merged = explicit_;

  // Implicit grants and explicit ones never narrow each other.
  for (const auto& item : implicit_) {
    const PolicyEntry* governing = LongestPrefix(item.first, explicit_lookup);
    unsigned inherited = (governing != nullptr) ? governing->access : ACCESS_NONE;
    auto it = merged.find(item.first);
    if (it != merged.end()) {
      it->second.access |= item.second.access;
    } else {
      PolicyEntry entry = item.second;
      entry.access |= inherited;
      merged[item.first] = entry;
    }
  }
  for (auto& item : merged) {
    if (item.second.implicit) continue;
    const PolicyEntry* governing = LongestPrefix(item.first, implicit_lookup);
    if (governing != nullptr) {
      item.second.access |= governing->access;
    }
  }

  // Drop entries an existing ancestor directory already covers.
  for (const auto& item : merged) {
    const PolicyEntry& entry = item.second;
    const PolicyEntry* parent = nullptr;
    std::vector<std::string> ancestors = PathAncestors(entry.path);
    for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
      auto found = merged.find(*it);
      if (found != merged.end() && found->second.is_directory) {
        parent = &found->second;
        break;
      }
    }
    if (parent != nullptr && !parent->pending && parent->access == entry.access) {
      PRINT_DEBUG("%s is covered by %s", entry.path.c_str(), parent->path.c_str());
      continue;
    }
    policy->entries_.push_back(entry);
  }

  std::vector<SymlinkAlias> aliases = resolver_.aliases();
  std::sort(aliases.begin(), aliases.end());
  aliases.erase(std::unique(aliases.begin(), aliases.end()), aliases.end());
  policy->aliases_ = aliases;
  policy->warnings_ = warnings_;
}


int PolicyBuilder::Build(const std::vector<Exception>& exceptions, ResolvedPolicy* policy) {
  *policy = ResolvedPolicy();

  bool any_execute = false;
  for (const Exception& exception : exceptions) {
    switch (exception.kind()) {
      case Exception::Kind::Read:
      case Exception::Kind::Write:
      case Exception::Kind::Execute:
        AddExplicit(exception);
        break;
      case Exception::Kind::Networking:
        policy->network_allowed_ = true;
        break;
      case Exception::Kind::CustomEnvironment:
        policy->has_custom_environment_ = true;
        policy->environment_ = exception.environment();
        break;
    }
  }

  for (const auto& item : explicit_) {
    const PolicyEntry& entry = item.second;
    if (!(entry.access & ACCESS_EXECUTE)) continue;
    any_execute = true;
    if (!entry.pending && !entry.is_directory) {
      AddExecuteClosure(entry.path, 0);
    }
  }

  if (any_execute && options_.implicit_library_reads) {
    AddLibraryRoots();
  }

  Merge(policy);
  PRINT_DEBUG("resolved policy:\n%s", policy->ToString().c_str());
  return 0;
}

}  // namespace tinycage
