/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */

#include "src/main/tools/path-resolver.h"
#include "src/main/tools/logging.h"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <deque>
#include <string>
#include <vector>

namespace tinycage {

static std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    if (end > start) {
      parts.push_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return parts;
}


std::string NormalizePath(const std::string& path) {
  std::vector<std::string> parts;
  for (const std::string& comp : SplitPath(path)) {
    if (comp == ".") {
      continue;
    } else if (comp == "..") {
      if (!parts.empty()) parts.pop_back();
    } else {
      parts.push_back(comp);
    }
  }
  if (parts.empty()) return "/";
  std::string res;
  for (const std::string& comp : parts) {
    res += "/" + comp;
  }
  return res;
}


bool IsPathPrefix(const std::string& base, const std::string& path) {
  if (base == "/") return !path.empty() && path[0] == '/';
  if (path.compare(0, base.size(), base) != 0) return false;
  return path.size() == base.size() || path[base.size()] == '/';
}


std::vector<std::string> PathAncestors(const std::string& path) {
  std::vector<std::string> res;
  if (path == "/") return res;
  res.push_back("/");
  size_t pos = 1;
  while ((pos = path.find('/', pos)) != std::string::npos) {
    res.push_back(path.substr(0, pos));
    ++pos;
  }
  return res;
}


static bool ReadLink(const std::string& path, std::string* out) {
  char buf[PATH_MAX];
  ssize_t n = readlink(path.c_str(), buf, sizeof(buf) - 1);
  if (n < 0) return false;
  if (n == 0) {
    errno = ENOENT;
    return false;
  }
  buf[n] = '\0';
  out->assign(buf, static_cast<size_t>(n));
  return true;
}


static ResolvedPath Unresolved(const std::string& prefix, const std::deque<std::string>& rest,
                               int err) {
  std::string joined = prefix;
  for (const std::string& comp : rest) {
    joined += "/" + comp;
  }
  ResolvedPath res;
  res.path = NormalizePath(joined);
  res.exists = false;
  res.error = err;
  return res;
}


PathResolver::PathResolver(const std::string& cwd) : cwd_(cwd) {}


ResolvedPath PathResolver::Resolve(const std::string& path) {
  std::string input = path;
  if (input.empty() || input[0] != '/') {
    input = cwd_ + "/" + input;
  }

  std::deque<std::string> todo;
  for (const std::string& comp : SplitPath(input)) {
    todo.push_back(comp);
  }

  // "" stands for the root directory.
  std::string resolved;
  mode_t mode = S_IFDIR;
  int links = 0;

  while (!todo.empty()) {
    const std::string comp = todo.front();
    todo.pop_front();

    if (comp == ".") {
      continue;
    }
    if (comp == "..") {
      size_t slash = resolved.rfind('/');
      resolved.resize(slash == std::string::npos ? 0 : slash);
      mode = S_IFDIR;
      continue;
    }

    const std::string candidate = resolved + "/" + comp;
    struct stat sb;
    if (lstat(candidate.c_str(), &sb) < 0) {
      return Unresolved(candidate, todo, errno);
    }

    if (S_ISLNK(sb.st_mode)) {
      if (++links > MAX_SYMLINK_FOLLOWS) {
        return Unresolved(candidate, todo, ELOOP);
      }
      std::string target;
      if (!ReadLink(candidate, &target)) {
        return Unresolved(candidate, todo, errno);
      }
      aliases_.push_back(SymlinkAlias{candidate, target});

      std::vector<std::string> target_parts = SplitPath(target);
      for (auto it = target_parts.rbegin(); it != target_parts.rend(); ++it) {
        todo.push_front(*it);
      }
      if (target[0] == '/') {
        resolved.clear();
        mode = S_IFDIR;
      }
      continue;
    }

    resolved = candidate;
    mode = sb.st_mode;
    if (!todo.empty() && !S_ISDIR(mode)) {
      return Unresolved(resolved, todo, ENOTDIR);
    }
  }

  ResolvedPath res;
  res.path = resolved.empty() ? "/" : resolved;
  res.exists = true;
  res.is_directory = S_ISDIR(mode);
  res.is_regular = S_ISREG(mode);
  return res;
}


bool PathResolver::ReadInterpreter(const std::string& path, std::string* interpreter,
                                   std::string* argument) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    PRINT_DEBUG("cannot open %s to look for an interpreter: %s", path.c_str(), strerror(errno));
    return false;
  }
  char buf[256];
  ssize_t n;
  do {
    n = read(fd, buf, sizeof(buf));
  } while (n < 0 && errno == EINTR);
  close(fd);
  if (n < 3 || buf[0] != '#' || buf[1] != '!') {
    return false;
  }

  std::string line(buf + 2, static_cast<size_t>(n) - 2);
  size_t eol = line.find('\n');
  if (eol != std::string::npos) line.resize(eol);

  const char* blanks = " \t\r";
  size_t begin = line.find_first_not_of(blanks);
  if (begin == std::string::npos) return false;
  size_t end = line.find_first_of(blanks, begin);
  interpreter->assign(line, begin, end == std::string::npos ? std::string::npos : end - begin);

  argument->clear();
  if (end != std::string::npos) {
    size_t arg_begin = line.find_first_not_of(blanks, end);
    size_t arg_end = line.find_last_not_of(blanks);
    if (arg_begin != std::string::npos) {
      argument->assign(line, arg_begin, arg_end - arg_begin + 1);
    }
  }
  return !interpreter->empty();
}


int PathResolver::FindProgram(const std::string& name, const std::string& search_path,
                              std::string* out) {
  if (name.empty()) {
    return ENOENT;
  }
  if (name.find('/') != std::string::npos) {
    *out = name;
    return 0;
  }

  bool saw_eacces = false;
  size_t start = 0;
  while (start <= search_path.size()) {
    size_t end = search_path.find(':', start);
    if (end == std::string::npos) end = search_path.size();
    std::string dir = search_path.substr(start, end - start);
    if (dir.empty()) dir = ".";
    start = end + 1;

    const std::string candidate = dir + "/" + name;
    struct stat sb;
    if (stat(candidate.c_str(), &sb) < 0 || !S_ISREG(sb.st_mode)) {
      continue;
    }
    if (access(candidate.c_str(), X_OK) == 0) {
      *out = candidate;
      return 0;
    }
    saw_eacces = true;
  }
  return saw_eacces ? EACCES : ENOENT;
}


std::vector<std::string> PathResolver::LibraryRoots() {
#if defined(__APPLE__)
  return {
      "/usr/lib",
      "/System/Library",
      "/System/Cryptexes",
      "/System/Volumes/Preboot/Cryptexes",
      "/Library/Apple/usr/lib",
      "/private/var/db/dyld",
  };
#else
  return {
      "/lib",
      "/lib32",
      "/lib64",
      "/libx32",
      "/usr/lib",
      "/usr/lib32",
      "/usr/lib64",
      "/usr/libx32",
      "/usr/local/lib",
      "/etc/ld.so.cache",
      "/etc/ld.so.conf",
      "/etc/ld.so.conf.d",
  };
#endif
}

}  // namespace tinycage
