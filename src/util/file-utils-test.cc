// util/file-utils-test.cc

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

#include <stdlib.h>
#include <unistd.h>

#include <fstream>

#include "base/speechseg-common.h"
#include "util/file-utils.h"
#include "util/subprocess.h"

namespace speechseg {

static void Touch(const std::string &path) {
  std::ofstream os(path.c_str());
  os << "x";
}

void UnitTestPathFunctions() {
  SPEECHSEG_ASSERT(JoinPath("a", "b") == "a/b");
  SPEECHSEG_ASSERT(JoinPath("a/", "/b") == "a/b");
  SPEECHSEG_ASSERT(JoinPath("/", "b") == "/b");
  SPEECHSEG_ASSERT(JoinPath("", "b") == "b");
  SPEECHSEG_ASSERT(JoinPath("a", "") == "a");
  SPEECHSEG_ASSERT(BaseName("/a/b/c.wav") == "c.wav");
  SPEECHSEG_ASSERT(BaseName("c.wav") == "c.wav");
  SPEECHSEG_ASSERT(BaseName("/a/b/") == "b");
  SPEECHSEG_ASSERT(DirName("/a/b/c.wav") == "/a/b");
  SPEECHSEG_ASSERT(DirName("c.wav") == ".");
  SPEECHSEG_ASSERT(DirName("/c.wav") == "/");
  SPEECHSEG_ASSERT(FileStem("/a/b/x.y.wav") == "x.y");
  SPEECHSEG_ASSERT(FileStem(".hidden") == ".hidden");
  SPEECHSEG_ASSERT(FileStem("noext") == "noext");
  SPEECHSEG_ASSERT(RelativePath("/data/in", "/data/in/a/b/x.wav") ==
                   "a/b/x.wav");
  SPEECHSEG_ASSERT(RelativePath("/data/in/", "/data/in/x.wav") == "x.wav");
  SPEECHSEG_ASSERT(RelativePath("/data/in", "/data/input/x.wav") ==
                   "/data/input/x.wav");

  SPEECHSEG_ASSERT(NormalizePath("./a//b/../c/") == "a/c");
  SPEECHSEG_ASSERT(NormalizePath("./out/a/x_segment/segment_1.wav") ==
                   "out/a/x_segment/segment_1.wav");
  SPEECHSEG_ASSERT(NormalizePath(".") == ".");
  SPEECHSEG_ASSERT(NormalizePath("./") == ".");
  SPEECHSEG_ASSERT(NormalizePath("a/..") == ".");
  SPEECHSEG_ASSERT(NormalizePath("../x") == "../x");
  SPEECHSEG_ASSERT(NormalizePath("/data/./in/") == "/data/in");
  SPEECHSEG_ASSERT(NormalizePath("/..") == "/");
  SPEECHSEG_ASSERT(AbsolutePath("/data/in/../out") == "/data/out");
  std::string cwd = AbsolutePath(".");
  SPEECHSEG_ASSERT(!cwd.empty() && cwd[0] == '/');
  SPEECHSEG_ASSERT(AbsolutePath("./out/a") == JoinPath(cwd, "out/a"));
  SPEECHSEG_ASSERT(AbsolutePath("out") == AbsolutePath("./out/"));
}

void UnitTestDirectories() {
  char tmpl[] = "/tmp/speechseg-file-utils-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string root = tmpl;

  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(root, "in/a/b")));
  SPEECHSEG_ASSERT(IsDirectory(JoinPath(root, "in/a/b")));
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(root, "in/a/b")));  // exists
  Touch(JoinPath(root, "in/z.wav"));
  Touch(JoinPath(root, "in/a/y.WAV"));
  Touch(JoinPath(root, "in/a/b/x.wav"));
  Touch(JoinPath(root, "in/a/b/notes.txt"));
  Touch(JoinPath(root, "in/a/b/.wav"));

  // A file is in the way of a directory.
  SPEECHSEG_ASSERT(!CreateDirectories(JoinPath(root, "in/z.wav/sub")));

  std::vector<std::string> files;
  SPEECHSEG_ASSERT(FindFilesRecursive(JoinPath(root, "in"), "wav", &files));
  SPEECHSEG_ASSERT(files.size() == 3);
  SPEECHSEG_ASSERT(files[0] == JoinPath(root, "in/a/b/x.wav"));
  SPEECHSEG_ASSERT(files[1] == JoinPath(root, "in/a/y.WAV"));
  SPEECHSEG_ASSERT(files[2] == JoinPath(root, "in/z.wav"));

  // Segment folders are found without descending into them.
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(root, "out/a/x_segment")));
  SPEECHSEG_ASSERT(CreateDirectories(
      JoinPath(root, "out/a/x_segment/inner_segment")));
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(root, "out/y_segment")));
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(root, "out/keep")));
  std::vector<std::string> dirs;
  SPEECHSEG_ASSERT(FindDirectoriesWithSuffix(JoinPath(root, "out"),
                                             "_segment", &dirs));
  SPEECHSEG_ASSERT(dirs.size() == 2);
  SPEECHSEG_ASSERT(dirs[0] == JoinPath(root, "out/a/x_segment"));
  SPEECHSEG_ASSERT(dirs[1] == JoinPath(root, "out/y_segment"));

  std::string temp = JoinPath(root, "temp");
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(temp, "job1")));
  Touch(JoinPath(temp, "job1/x.wav"));
  Touch(JoinPath(temp, "y.wav"));
  SPEECHSEG_ASSERT(ClearDirectory(temp));
  SPEECHSEG_ASSERT(IsDirectory(temp));
  files.clear();
  SPEECHSEG_ASSERT(FindFilesRecursive(temp, "wav", &files));
  SPEECHSEG_ASSERT(files.empty());
  SPEECHSEG_ASSERT(!FileExists(JoinPath(temp, "job1")));

  // A link cycle is not followed; a link to a file is listed.
  std::string links = JoinPath(root, "links");
  SPEECHSEG_ASSERT(CreateDirectories(JoinPath(links, "sub")));
  Touch(JoinPath(links, "sub/real.wav"));
  SPEECHSEG_ASSERT(symlink("..", JoinPath(links, "sub/up").c_str()) == 0);
  SPEECHSEG_ASSERT(symlink("real.wav",
                           JoinPath(links, "sub/alias.wav").c_str()) == 0);
  SPEECHSEG_ASSERT(symlink("missing.wav",
                           JoinPath(links, "sub/dangling.wav").c_str()) == 0);
  files.clear();
  SPEECHSEG_ASSERT(FindFilesRecursive(links, "wav", &files));
  SPEECHSEG_ASSERT(files.size() == 2);
  SPEECHSEG_ASSERT(files[0] == JoinPath(links, "sub/alias.wav"));
  SPEECHSEG_ASSERT(files[1] == JoinPath(links, "sub/real.wav"));

  SPEECHSEG_ASSERT(RemoveTree(root));
  SPEECHSEG_ASSERT(!FileExists(root));
  SPEECHSEG_ASSERT(RemoveTree(root));  // already gone
}

void UnitTestRunCommand() {
  std::vector<std::string> argv;
  argv.push_back("sh");
  argv.push_back("-c");
  argv.push_back("echo problem >&2; exit 3");
  CommandResult result;
  SPEECHSEG_ASSERT(!RunCommand(argv, &result));
  SPEECHSEG_ASSERT(result.exit_status == 3);
  SPEECHSEG_ASSERT(result.stderr_tail == "problem\n");

  argv[2] = "exit 0";
  SPEECHSEG_ASSERT(RunCommand(argv, &result));
  SPEECHSEG_ASSERT(result.Succeeded() && result.stderr_tail.empty());

  std::vector<std::string> missing;
  missing.push_back("speechseg-no-such-program");
  SPEECHSEG_ASSERT(!RunCommand(missing, &result));
  SPEECHSEG_ASSERT(result.exit_status == 127);

  SPEECHSEG_ASSERT(CommandToString(argv) == "sh -c 'exit 0'");
}

}  // end namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestPathFunctions();
  UnitTestDirectories();
  UnitTestRunCommand();
  std::cout << "Test OK.\n";
  return 0;
}
