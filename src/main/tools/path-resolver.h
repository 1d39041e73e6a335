/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#ifndef SRC_MAIN_TOOLS_PATH_RESOLVER_H_
#define SRC_MAIN_TOOLS_PATH_RESOLVER_H_

#include <string>
#include <vector>

#include "src/main/tools/error-handling.h"

namespace tinycage {

// Symlinks followed while resolving more than this many links fail with ELOOP.
#define MAX_SYMLINK_FOLLOWS 40
// Longest chain of "#!" interpreters followed by the execute closure.
#define MAX_INTERPRETER_DEPTH 4

// A symlink traversed during canonicalization. `link` is the absolute location
// of the link (its parent already canonical), `target` the raw readlink()
// contents.
struct SymlinkAlias {
  std::string link;
  std::string target;

  bool operator==(const SymlinkAlias& other) const {
    return link == other.link && target == other.target;
  }
  bool operator<(const SymlinkAlias& other) const {
    return link < other.link || (link == other.link && target < other.target);
  }
};

// A path that could not be canonicalized completely when the policy was
// resolved. Carried as a warning; the grant itself is kept.
struct ResolutionWarning {
  ErrorCode code = ErrorCode::PathNotResolved;
  std::string path;
  std::string resolved;
  int os_errno;
  std::string message;
};

struct ResolvedPath {
  // Absolute path. Fully symlink-free when `exists`, otherwise the resolved
  // existing prefix followed by the lexically normalized remainder.
  std::string path;
  bool exists = false;
  bool is_directory = false;
  bool is_regular = false;
  // errno that stopped the resolution, 0 when `exists`.
  int error = 0;
};

// Removes ".", ".." and duplicate slashes without touching the filesystem.
// `path` must be absolute.
std::string NormalizePath(const std::string& path);

// Returns true if `path` equals `base` or lies below it. Both must be
// normalized absolute paths.
bool IsPathPrefix(const std::string& base, const std::string& path);

// Returns the list of ancestors of `path` from "/" down to its parent.
std::vector<std::string> PathAncestors(const std::string& path);

// Canonicalizes paths component by component the way the kernel does on
// lookup, remembering every symlink it crosses. Only reads the filesystem.
class PathResolver {
 public:
  // Relative paths are anchored at `cwd`, which must be absolute.
  explicit PathResolver(const std::string& cwd);

  ResolvedPath Resolve(const std::string& path);

  // Symlinks crossed by every Resolve() call so far, in traversal order.
  const std::vector<SymlinkAlias>& aliases() const { return aliases_; }

  // Reads the "#!" line of `path`. Returns true and sets `interpreter` (and
  // `argument`, possibly empty) if the file is a script.
  static bool ReadInterpreter(const std::string& path, std::string* interpreter,
                              std::string* argument);

  // Looks `name` up the way execvp() does. Names containing a slash are
  // returned unchanged. Returns 0, or ENOENT/EACCES when no executable was found.
  static int FindProgram(const std::string& name, const std::string& search_path,
                         std::string* out);

  // System locations the dynamic loader reads shared libraries from on the
  // host operating system.
  static std::vector<std::string> LibraryRoots();

 private:
  std::string cwd_;
  std::vector<SymlinkAlias> aliases_;
};

}  // namespace tinycage

#endif  // SRC_MAIN_TOOLS_PATH_RESOLVER_H_
