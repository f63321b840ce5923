// segbin/clear-workspace.cc

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

#include "base/speechseg-common.h"
#include "pipeline/workspace.h"
#include "util/parse-options.h"

int main(int argc, char *argv[]) {
  try {
    using namespace speechseg;
    const char *usage =
        "Empty the temporary workspace of segment-audio-dir and, if an\n"
        "output directory is given, delete every segment folder (named\n"
        "*<segment-suffix>) below it.  Do not run this while a batch is\n"
        "using the same directories.\n"
        "\n"
        "Usage:  clear-workspace [options] <temp-dir> [<output-dir>]\n"
        "e.g.: clear-workspace temp audio_sentences\n"
        "See also: segment-audio-dir\n";

    ParseOptions po(usage);
    std::string segment_suffix = "_segment";
    po.Register("segment-suffix", &segment_suffix, "Suffix of the segment "
                "folder names to delete below <output-dir>; \"_\" followed "
                "by the --segment-name of the run");

    po.Read(argc, argv);

    if (po.NumArgs() < 1 || po.NumArgs() > 2) {
      po.PrintUsage();
      exit(1);
    }

    std::string temp_dir = po.GetArg(1),
        output_dir = po.GetOptArg(2);

    if (segment_suffix.empty())
      SPEECHSEG_ERR << "--segment-suffix must not be empty";

    Workspace workspace(temp_dir);
    if (!workspace.Clear())
      SPEECHSEG_ERR << "Could not clear " << temp_dir;

    if (!output_dir.empty() &&
        ClearSegmentFolders(output_dir, segment_suffix) < 0)
      SPEECHSEG_ERR << "Could not list " << output_dir;
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
