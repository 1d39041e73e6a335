/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_POLICY_H_
#define SRC_MAIN_TOOLS_POLICY_H_

#include <map>
#include <string>
#include <vector>

#include "src/main/tools/exception.h"
#include "src/main/tools/path-resolver.h"

namespace tinycage {

struct PolicyEntry {
  // Canonical absolute path, see ResolvedPath for pending entries.
  std::string path;
  unsigned access = ACCESS_NONE;
  bool is_directory = false;
  // The path did not exist when the policy was resolved.
  bool pending = false;
  // Added by the execute closure rather than by a caller.
  bool implicit = false;

  bool operator==(const PolicyEntry& other) const {
    return path == other.path && access == other.access && is_directory == other.is_directory &&
           pending == other.pending && implicit == other.implicit;
  }
};

struct PolicyOptions {
  // Anchor for relative exception paths. Must be absolute.
  std::string cwd;
  // Search path used for "#!/usr/bin/env NAME" interpreters.
  std::string search_path;
  // Grant the system library directories whenever something is executable.
  bool implicit_library_reads = true;
};

// The merged, canonical form of a set of exceptions. Immutable once built.
class ResolvedPolicy {
 public:
  // Sorted by path, one entry per path.
  const std::vector<PolicyEntry>& entries() const { return entries_; }
  // Sorted by link location, without duplicates.
  const std::vector<SymlinkAlias>& aliases() const { return aliases_; }
  bool network_allowed() const { return network_allowed_; }
  bool has_custom_environment() const { return has_custom_environment_; }
  const EnvironmentMap& environment() const { return environment_; }
  const std::vector<ResolutionWarning>& warnings() const { return warnings_; }

  // Entry registered for exactly `path`, or nullptr.
  const PolicyEntry* FindEntry(const std::string& path) const;

  // Deepest entry at or above `path`, or nullptr.
  const PolicyEntry* GoverningEntry(const std::string& path) const;

  // Access the policy grants on the canonical `path` (longest-prefix match).
  unsigned AccessFor(const std::string& path) const;

  // True if every bit of `access` is granted on the canonical `path`.
  bool Allows(const std::string& path, unsigned access) const;

  // One line per entry, for debug output.
  std::string ToString() const;

  // Warnings are diagnostics and do not take part in the comparison.
  bool operator==(const ResolvedPolicy& other) const;
  bool operator!=(const ResolvedPolicy& other) const { return !(*this == other); }

 private:
  friend class PolicyBuilder;

  std::vector<PolicyEntry> entries_;
  std::vector<SymlinkAlias> aliases_;
  bool network_allowed_ = false;
  bool has_custom_environment_ = false;
  EnvironmentMap environment_;
  std::vector<ResolutionWarning> warnings_;
};

// Resolves a list of validated exceptions into a ResolvedPolicy. A builder is
// good for one Build() call.
class PolicyBuilder {
 public:
  explicit PolicyBuilder(const PolicyOptions& options);

  // Resolution itself never fails: unresolvable paths end up as pending
  // entries with a warning. Returns 0.
  int Build(const std::vector<Exception>& exceptions, ResolvedPolicy* policy);

 private:
  typedef std::map<std::string, PolicyEntry> EntryMap;

  void AddExplicit(const Exception& exception);
  void AddExecuteClosure(const std::string& binary, int depth);
  void AddImplicit(const ResolvedPath& resolved, unsigned access);
  void AddLibraryRoots();
  void AddWarning(const std::string& path, const ResolvedPath& resolved);
  void Merge(ResolvedPolicy* policy);

  PolicyOptions options_;
  PathResolver resolver_;
  EntryMap explicit_;
  EntryMap implicit_;
  std::vector<ResolutionWarning> warnings_;
};

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_POLICY_H_
