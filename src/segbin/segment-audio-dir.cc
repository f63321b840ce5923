// segbin/segment-audio-dir.cc

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

#include <signal.h>

#include "base/speechseg-common.h"
#include "media/media-toolchain.h"
#include "pipeline/batch-orchestrator.h"
#include "pipeline/segmentation-pipeline.h"
#include "util/log-sink.h"
#include "util/parse-options.h"

namespace {

speechseg::CancellationToken g_interrupted;

// The first Ctrl-C stops the batch after the running files; a second one
// kills the program.
extern "C" void HandleInterrupt(int signum) {
  g_interrupted.Cancel();
  signal(signum, SIG_DFL);
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    using namespace speechseg;
    const char *usage =
        "Find the speech in every audio file below a directory and cut it\n"
        "into segment files.  Each file <input-dir>/a/b/x.wav gives a folder\n"
        "<output-dir>/a/b/x_segment with segment_1.wav, segment_2.wav, ...\n"
        "and a manifest segment_all.csv listing their time ranges.  The\n"
        "segments are cut from the original files without re-encoding; the\n"
        "VAD reads converted working copies kept in --temp-dir.\n"
        "\n"
        "Usage:  segment-audio-dir [options] <input-dir> <output-dir>\n"
        "e.g.: segment-audio-dir --aggressiveness=3 --min-len=2.0 archive "
        "audio_sentences\n"
        "See also: compute-speech-segments, cut-segments, clear-workspace\n";

    ParseOptions po(usage);
    PipelineOptions pipeline_opts;
    BatchOptions batch_opts;
    MediaToolOptions tool_opts;
    std::string log_file = "speechseg.log";

    pipeline_opts.Register(&po);
    batch_opts.Register(&po);
    tool_opts.Register(&po);
    po.Register("log-file", &log_file, "Messages are written to this file "
                "as well as to stderr; it is overwritten at the start of the "
                "run (empty for none)");

    po.Read(argc, argv);

    if (po.NumArgs() != 2) {
      po.PrintUsage();
      exit(1);
    }

    std::string input_dir = po.GetArg(1),
        output_dir = po.GetArg(2);

    LogFileSink sink;
    if (!log_file.empty() && !sink.Open(log_file))
      SPEECHSEG_WARN << "Continuing without a log file";

    pipeline_opts.Check();
    batch_opts.Check();
    MediaToolchain tools(tool_opts);
    SegmentationPipeline pipeline(pipeline_opts, tools.Primary(),
                                  tools.Fallback());
    BatchOrchestrator orchestrator(batch_opts, &pipeline);
    Workspace workspace(batch_opts.temp_dir);

    ClearPolicy policy = batch_opts.Policy();
    if ((policy == kClearBefore || policy == kClearBoth) && !workspace.Clear())
      SPEECHSEG_ERR << "Could not clear " << workspace.Root();

    signal(SIGINT, HandleInterrupt);
    signal(SIGTERM, HandleInterrupt);
    BatchSummary summary = orchestrator.Run(input_dir, output_dir,
                                            &g_interrupted);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    if ((policy == kClearAfter || policy == kClearBoth) && !workspace.Clear())
      SPEECHSEG_WARN << "Temporary files are left in " << workspace.Root();

    if (g_interrupted.IsCancelled()) {
      SPEECHSEG_WARN << "Interrupted; " << summary.num_cancelled
                     << " files were not processed.";
      return 130;
    }
    return (summary.num_failed == 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
