// pipeline/workspace.h

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

#ifndef SPEECHSEG_PIPELINE_WORKSPACE_H_
#define SPEECHSEG_PIPELINE_WORKSPACE_H_

#include <string>

#include "base/speechseg-common.h"

namespace speechseg {

/// When the batch program clears the temporary workspace.
enum ClearPolicy {
  kClearNever,
  kClearBefore,
  kClearAfter,
  kClearBoth
};

/// Parses "none", "before", "after" or "both".  Returns false for anything
/// else.
bool ParseClearPolicy(const std::string &str, ClearPolicy *policy);

/**
   The temporary directory that holds the working copies the VAD reads.
   It is shared by all jobs of a batch, each of which writes its own files
   in it, so it must only be cleared while no batch is running; that is up
   to the caller.  Clearing removes everything and leaves the directory
   existing and empty.
 */
class Workspace {
 public:
  explicit Workspace(const std::string &root): root_(root) { }

  const std::string &Root() const { return root_; }

  /// Creates the directory if needed.  Returns false and warns on failure.
  bool Prepare() const;

  /// Removes everything in the directory.  Returns false and warns on
  /// failure.
  bool Clear() const;

  /// Path of the working copy for a source file, given the source's path
  /// relative to the input root: the same relative directory below the
  /// workspace, and the source's file name with the extension changed to
  /// "wav".  Distinct sources therefore get distinct working copies, unless
  /// they differ only in their extension.
  std::string WorkingCopyPath(const std::string &relative_source) const;

 private:
  std::string root_;
};

/// Removes every directory below "root" whose name ends with "suffix" (for
/// example "_segment"), together with its contents.  Returns the number of
/// directories removed, or -1 if "root" could not be listed.  A missing root
/// counts as empty.
int32 ClearSegmentFolders(const std::string &root, const std::string &suffix);

}  // namespace speechseg

#endif  // SPEECHSEG_PIPELINE_WORKSPACE_H_
