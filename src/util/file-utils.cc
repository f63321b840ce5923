// util/file-utils.cc

// Copyright 2026  The speechseg Authors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#include "util/file-utils.h"

#include <dirent.h>
#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>

#include "util/text-utils.h"

namespace speechseg {

std::string JoinPath(const std::string &a, const std::string &b) {
  if (b.empty()) return a;
  if (a.empty()) return b;
  std::string ans = a;
  while (ans.size() > 1 && ans[ans.size() - 1] == '/')
    ans.erase(ans.size() - 1);
  if (ans != "/") ans += '/';
  size_t start = b.find_first_not_of('/');
  if (start == std::string::npos) return ans;
  ans.append(b, start, std::string::npos);
  return ans;
}

std::string BaseName(const std::string &path) {
  std::string p = path;
  while (p.size() > 1 && p[p.size() - 1] == '/')
    p.erase(p.size() - 1);
  size_t pos = p.rfind('/');
  if (pos == std::string::npos) return p;
  return p.substr(pos + 1);
}

std::string DirName(const std::string &path) {
  std::string p = path;
  while (p.size() > 1 && p[p.size() - 1] == '/')
    p.erase(p.size() - 1);
  size_t pos = p.rfind('/');
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return p.substr(0, pos);
}

std::string FileStem(const std::string &path) {
  std::string base = BaseName(path);
  size_t pos = base.rfind('.');
  // A leading dot (".hidden") is part of the name, not an extension.
  if (pos == std::string::npos || pos == 0) return base;
  return base.substr(0, pos);
}

std::string RelativePath(const std::string &root, const std::string &path) {
  std::string r = root;
  while (r.size() > 1 && r[r.size() - 1] == '/')
    r.erase(r.size() - 1);
  if (path.size() > r.size() && path.compare(0, r.size(), r) == 0 &&
      (path[r.size()] == '/' || r == "/")) {
    size_t start = path.find_first_not_of('/', r.size());
    if (start == std::string::npos) return "";
    return path.substr(start);
  }
  return path;
}

std::string NormalizePath(const std::string &path) {
  if (path.empty()) return path;
  bool absolute = (path[0] == '/');
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string::npos) next = path.size();
    std::string part = path.substr(pos, next - pos);
    pos = next + 1;
    if (part.empty() || part == ".") continue;
    if (part == ".." && !parts.empty() && parts.back() != "..") {
      parts.pop_back();
    } else if (part == ".." && absolute) {
      continue;  // "/.." is "/".
    } else {
      parts.push_back(part);
    }
  }
  std::string ans = (absolute ? "/" : "");
  for (size_t i = 0; i < parts.size(); i++) {
    if (i > 0) ans += '/';
    ans += parts[i];
  }
  if (ans.empty()) ans = ".";
  return ans;
}

std::string AbsolutePath(const std::string &path) {
  if (!path.empty() && path[0] == '/') return NormalizePath(path);
  std::vector<char> buf(4096);
  while (getcwd(&buf[0], buf.size()) == NULL) {
    if (errno != ERANGE)
      SPEECHSEG_ERR << "Could not get the current directory: "
                    << strerror(errno);
    buf.resize(buf.size() * 2);
  }
  return NormalizePath(JoinPath(std::string(&buf[0]), path));
}

bool FileExists(const std::string &path) {
  struct stat st;
  return lstat(path.c_str(), &st) == 0;
}

bool IsDirectory(const std::string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

bool CreateDirectories(const std::string &path) {
  if (path.empty()) return false;
  if (IsDirectory(path)) return true;
  std::string parent = DirName(path);
  if (parent != path && !IsDirectory(parent)) {
    if (!CreateDirectories(parent)) return false;
  }
  if (mkdir(path.c_str(), 0777) != 0 && errno != EEXIST) {
    SPEECHSEG_WARN << "Could not create directory " << path << ": "
                   << strerror(errno);
    return false;
  }
  if (!IsDirectory(path)) {
    SPEECHSEG_WARN << "Could not create directory " << path
                   << ": a file of that name is in the way";
    return false;
  }
  return true;
}

bool ListDirectory(const std::string &dir,
                          std::vector<std::string> *names) {
  names->clear();
  DIR *d = opendir(dir.c_str());
  if (d == NULL) {
    SPEECHSEG_WARN << "Could not open directory " << dir << ": "
                   << strerror(errno);
    return false;
  }
  struct dirent *entry;
  while ((entry = readdir(d)) != NULL) {
    if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0)
      continue;
    names->push_back(entry->d_name);
  }
  closedir(d);
  std::sort(names->begin(), names->end());
  return true;
}

bool RemoveTree(const std::string &path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0) {
    if (errno == ENOENT) return true;
    SPEECHSEG_WARN << "Could not stat " << path << ": " << strerror(errno);
    return false;
  }
  if (!S_ISDIR(st.st_mode)) {
    if (unlink(path.c_str()) != 0) {
      SPEECHSEG_WARN << "Could not remove " << path << ": " << strerror(errno);
      return false;
    }
    return true;
  }
  std::vector<std::string> names;
  if (!ListDirectory(path, &names)) return false;
  bool ok = true;
  for (size_t i = 0; i < names.size(); i++)
    if (!RemoveTree(JoinPath(path, names[i]))) ok = false;
  if (!ok) return false;
  if (rmdir(path.c_str()) != 0) {
    SPEECHSEG_WARN << "Could not remove directory " << path << ": "
                   << strerror(errno);
    return false;
  }
  return true;
}

bool ClearDirectory(const std::string &dir) {
  if (!RemoveTree(dir)) return false;
  return CreateDirectories(dir);
}

bool FindFilesRecursive(const std::string &root, const std::string &extension,
                        std::vector<std::string> *files) {
  std::vector<std::string> names;
  if (!ListDirectory(root, &names)) return false;
  bool ok = true;
  for (size_t i = 0; i < names.size(); i++) {
    std::string path = JoinPath(root, names[i]);
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
      SPEECHSEG_WARN << "Could not stat " << path << ": " << strerror(errno);
      continue;
    }
    if (S_ISDIR(st.st_mode)) {
      if (!FindFilesRecursive(path, extension, files)) ok = false;
      continue;
    }
    // Links to files are followed, links to directories are not, so that a
    // link cycle cannot make the walk endless.
    if (S_ISLNK(st.st_mode)) {
      if (stat(path.c_str(), &st) != 0) {
        SPEECHSEG_WARN << "Skipping dangling link " << path;
        continue;
      }
      if (S_ISDIR(st.st_mode)) {
        SPEECHSEG_VLOG(2) << "Not following directory link " << path;
        continue;
      }
    }
    if (S_ISREG(st.st_mode) &&
        EndsWith(names[i], "." + extension, true) &&
        names[i].size() > extension.size() + 1) {
      files->push_back(path);
    }
  }
  return ok;
}

bool FindDirectoriesWithSuffix(const std::string &root,
                               const std::string &suffix,
                               std::vector<std::string> *dirs) {
  std::vector<std::string> names;
  if (!ListDirectory(root, &names)) return false;
  bool ok = true;
  for (size_t i = 0; i < names.size(); i++) {
    std::string path = JoinPath(root, names[i]);
    struct stat st;
    if (lstat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) continue;
    if (EndsWith(names[i], suffix)) {
      dirs->push_back(path);
    } else if (!FindDirectoriesWithSuffix(path, suffix, dirs)) {
      ok = false;
    }
  }
  return ok;
}

}  // namespace speechseg
