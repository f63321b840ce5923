// pipeline/workspace-test.cc

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

#include <cstdlib>
#include <fstream>

#include "pipeline/workspace.h"
#include "util/file-utils.h"

namespace speechseg {

static void Touch(const std::string &filename) {
  std::ofstream os(filename.c_str());
  os << "x";
}

void UnitTestClearPolicy() {
  ClearPolicy policy = kClearNever;
  SPEECHSEG_ASSERT(ParseClearPolicy("before", &policy) &&
                   policy == kClearBefore);
  SPEECHSEG_ASSERT(ParseClearPolicy("after", &policy) &&
                   policy == kClearAfter);
  SPEECHSEG_ASSERT(ParseClearPolicy("both", &policy) && policy == kClearBoth);
  SPEECHSEG_ASSERT(ParseClearPolicy("none", &policy) && policy == kClearNever);
  SPEECHSEG_ASSERT(!ParseClearPolicy("always", &policy));
  SPEECHSEG_ASSERT(policy == kClearNever);
}

void UnitTestWorkingCopyPath() {
  Workspace ws("temp");
  SPEECHSEG_ASSERT(ws.WorkingCopyPath("x.wav") == "temp/x.wav");
  SPEECHSEG_ASSERT(ws.WorkingCopyPath("a/b/x.wav") == "temp/a/b/x.wav");
  SPEECHSEG_ASSERT(ws.WorkingCopyPath("a/x.mp3") == "temp/a/x.wav");
  // Same base name in different directories: different working copies.
  SPEECHSEG_ASSERT(ws.WorkingCopyPath("a/x.wav") !=
                   ws.WorkingCopyPath("b/x.wav"));
}

void UnitTestPrepareAndClear() {
  char tmpl[] = "/tmp/speechseg-workspace-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl;
  Workspace ws(JoinPath(dir, "temp"));
  SPEECHSEG_ASSERT(ws.Prepare() && IsDirectory(ws.Root()));
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(ws.Root(), "a/b")));
  Touch(JoinPath(ws.Root(), "a/b/x.wav"));
  Touch(JoinPath(ws.Root(), "y.wav"));
  SPEECHSEG_ASSERT(ws.Clear());
  SPEECHSEG_ASSERT(IsDirectory(ws.Root()));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(ws.Root(), "a")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(ws.Root(), "y.wav")));
  // Clearing a missing workspace creates it.
  SPEECHSEG_ASSERT(RemoveTree(ws.Root()));
  SPEECHSEG_ASSERT(ws.Clear() && IsDirectory(ws.Root()));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestClearSegmentFolders() {
  char tmpl[] = "/tmp/speechseg-workspace-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl;
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(dir, "a/x_segment/segment_1")));
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(dir, "a/b/y_segment")));
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(dir, "a/keep")));
  Touch(JoinPath(dir, "a/x_segment/segment_all.csv"));
  Touch(JoinPath(dir, "a/z_segment"));  // a file, not a folder
  SPEECHSEG_ASSERT(ClearSegmentFolders(dir, "_segment") == 2);
  SPEECHSEG_ASSERT(!FileExists(JoinPath(dir, "a/x_segment")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(dir, "a/b/y_segment")));
  SPEECHSEG_ASSERT(IsDirectory(JoinPath(dir, "a/b")));
  SPEECHSEG_ASSERT(IsDirectory(JoinPath(dir, "a/keep")));
  SPEECHSEG_ASSERT(FileExists(JoinPath(dir, "a/z_segment")));
  SPEECHSEG_ASSERT(ClearSegmentFolders(dir, "_segment") == 0);
  SPEECHSEG_ASSERT(ClearSegmentFolders(JoinPath(dir, "missing"),
                                       "_segment") == 0);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestClearPolicy();
  UnitTestWorkingCopyPath();
  UnitTestPrepareAndClear();
  UnitTestClearSegmentFolders();
  std::cout << "Test OK.\n";
  return 0;
}
