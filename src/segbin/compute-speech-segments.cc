// segbin/compute-speech-segments.cc

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
#include "media/media-toolchain.h"
#include "pipeline/segmentation-pipeline.h"
#include "pipeline/workspace.h"
#include "util/file-utils.h"
#include "util/parse-options.h"
#include "util/text-utils.h"

int main(int argc, char *argv[]) {
  try {
    using namespace speechseg;
    const char *usage =
        "Find the speech segments of one audio file and print them, one per\n"
        "line, as \"<start-sec> <end-sec> <duration-sec>\".  Nothing is cut.\n"
        "The converted working copy is written to --temp-dir and removed\n"
        "afterwards.\n"
        "\n"
        "Usage:  compute-speech-segments [options] <audio-file> "
        "[<segments-out>]\n"
        "e.g.: compute-speech-segments --frame-duration=20 talk.wav -\n"
        "See also: segment-audio-dir, cut-segments\n";

    ParseOptions po(usage);
    PipelineOptions pipeline_opts;
    MediaToolOptions tool_opts;
    std::string temp_dir = "temp";

    pipeline_opts.Register(&po);
    tool_opts.Register(&po);
    po.Register("temp-dir", &temp_dir, "Directory for the working copy");

    po.Read(argc, argv);

    if (po.NumArgs() < 1 || po.NumArgs() > 2) {
      po.PrintUsage();
      exit(1);
    }

    std::string audio_file = po.GetArg(1),
        segments_out = po.GetOptArg(2);

    MediaToolchain tools(tool_opts);
    SegmentationPipeline pipeline(pipeline_opts, tools.Primary(),
                                  tools.Fallback());
    Workspace workspace(temp_dir);
    if (!workspace.Prepare())
      SPEECHSEG_ERR << "Could not create " << temp_dir;

    ProcessingJob job;
    job.source = audio_file;
    job.working_copy = workspace.WorkingCopyPath(BaseName(audio_file));

    SegmentList segments;
    JobResult result;
    bool ok = pipeline.ComputeSegments(job, &segments, &result);
    if (pipeline_opts.resample_opts.resample && !RemoveTree(job.working_copy))
      SPEECHSEG_WARN << "Could not remove " << job.working_copy;
    if (!ok)
      SPEECHSEG_ERR << "Could not process " << audio_file << ": "
                    << JobStatusName(result.status) << ": " << result.reason;

    std::ofstream ofs;
    if (!segments_out.empty() && segments_out != "-") {
      ofs.open(segments_out.c_str());
      if (!ofs.is_open())
        SPEECHSEG_ERR << "Could not open " << segments_out << " for writing";
    }
    std::ostream &os = (ofs.is_open() ? ofs : std::cout);
    for (size_t i = 0; i < segments.size(); i++)
      os << FormatSeconds(segments[i].start_sec) << ' '
         << FormatSeconds(segments[i].end_sec) << ' '
         << FormatSeconds(segments[i].duration_sec) << '\n';
    os.flush();
    if (!os.good())
      SPEECHSEG_ERR << "Error writing segments";

    SPEECHSEG_LOG << "Found " << segments.size() << " speech segments in "
                  << audio_file;
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
