// pipeline/workspace.cc

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

#include "pipeline/workspace.h"

#include <vector>

#include "util/file-utils.h"

namespace speechseg {

bool ParseClearPolicy(const std::string &str, ClearPolicy *policy) {
  if (str == "none") *policy = kClearNever;
  else if (str == "before") *policy = kClearBefore;
  else if (str == "after") *policy = kClearAfter;
  else if (str == "both") *policy = kClearBoth;
  else
    return false;
  return true;
}

bool Workspace::Prepare() const {
  if (!CreateDirectories(root_)) {
    SPEECHSEG_WARN << "Could not create workspace " << root_;
    return false;
  }
  return true;
}

bool Workspace::Clear() const {
  if (!ClearDirectory(root_)) {
    SPEECHSEG_WARN << "Could not clear workspace " << root_;
    return false;
  }
  SPEECHSEG_LOG << "Cleared all temporary files in " << root_;
  return true;
}

std::string Workspace::WorkingCopyPath(
    const std::string &relative_source) const {
  std::string dir = DirName(relative_source),
      name = FileStem(relative_source) + ".wav";
  if (dir == ".") return JoinPath(root_, name);
  return JoinPath(JoinPath(root_, dir), name);
}

int32 ClearSegmentFolders(const std::string &root, const std::string &suffix) {
  if (!FileExists(root)) {
    SPEECHSEG_LOG << "Root directory " << root << " does not exist";
    return 0;
  }
  std::vector<std::string> dirs;
  if (!FindDirectoriesWithSuffix(root, suffix, &dirs))
    return -1;
  int32 count = 0;
  for (size_t i = 0; i < dirs.size(); i++) {
    if (RemoveTree(dirs[i]))
      count++;
    else
      SPEECHSEG_WARN << "Could not remove " << dirs[i];
  }
  SPEECHSEG_LOG << "Cleared " << count << " *" << suffix << " folders under "
                << root;
  return count;
}

}  // namespace speechseg
