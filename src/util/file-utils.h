// util/file-utils.h

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

#ifndef SPEECHSEG_UTIL_FILE_UTILS_H_
#define SPEECHSEG_UTIL_FILE_UTILS_H_

#include <string>
#include <vector>

#include "base/speechseg-common.h"

namespace speechseg {

/// \addtogroup file_utils
/// @{
/// Path manipulation and directory handling on POSIX systems.  Paths are
/// plain strings with '/' separators.  Functions that touch the disk return
/// false and print a warning on failure; they never throw.

/// Joins two path components with exactly one '/' between them.  If "b" is
/// empty, returns "a"; if "a" is empty, returns "b".
std::string JoinPath(const std::string &a, const std::string &b);

/// Returns the last component of the path ("/a/b/c.wav" -> "c.wav").
std::string BaseName(const std::string &path);

/// Returns everything before the last component ("/a/b/c.wav" -> "/a/b"),
/// or "." if there is no '/'.
std::string DirName(const std::string &path);

/// Returns the base name without its last extension ("x.y.wav" -> "x.y").
std::string FileStem(const std::string &path);

/// If "path" is inside "root", returns the part of it after "root/";
/// otherwise returns "path" unchanged.  Purely textual.
std::string RelativePath(const std::string &root, const std::string &path);

/// Removes "." components and repeated or trailing slashes, and folds "x/.."
/// away, without looking at the disk ("./a//b/../c/" -> "a/c").  Returns
/// "." for a path that folds to nothing.  Symbolic links are not resolved.
std::string NormalizePath(const std::string &path);

/// Returns NormalizePath() of "path" made absolute against the current
/// directory.  Dies with SPEECHSEG_ERR if the current directory is unknown.
std::string AbsolutePath(const std::string &path);

bool FileExists(const std::string &path);

bool IsDirectory(const std::string &path);

/// Creates the directory and any missing parents, like "mkdir -p".  Returns
/// true if the directory exists when the call returns.
bool CreateDirectories(const std::string &path);

/// Lists the names in "dir", excluding "." and "..", in sorted order.
bool ListDirectory(const std::string &dir, std::vector<std::string> *names);

/// Deletes a file, or a directory with everything below it.  Symbolic links
/// are removed, never followed.  A path that does not exist counts as
/// success.
bool RemoveTree(const std::string &path);

/// Removes everything inside "dir" and leaves it existing and empty,
/// creating it if needed.
bool ClearDirectory(const std::string &dir);

/// Recursively lists regular files under "root" whose extension equals
/// "extension" (case-insensitive, no dot), appending them to "files".  Names
/// are visited in sorted order within each directory, so that repeated runs
/// see files in the same order.  Symbolic links to files are listed;
/// symbolic links to directories are not descended into.
bool FindFilesRecursive(const std::string &root, const std::string &extension,
                        std::vector<std::string> *files);

/// Recursively lists directories under "root" whose name ends with
/// "suffix".  A matching directory is not descended into.
bool FindDirectoriesWithSuffix(const std::string &root,
                               const std::string &suffix,
                               std::vector<std::string> *dirs);

/// @} end "addtogroup file_utils"

}  // namespace speechseg

#endif  // SPEECHSEG_UTIL_FILE_UTILS_H_
