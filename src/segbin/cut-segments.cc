// segbin/cut-segments.cc

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
#include "media/manifest.h"
#include "media/media-toolchain.h"
#include "media/segment-cutter.h"
#include "util/parse-options.h"

int main(int argc, char *argv[]) {
  try {
    using namespace speechseg;
    const char *usage =
        "Cut an audio file into the segments listed in a CSV file, without\n"
        "re-encoding.  The CSV file needs a header naming \"start_sec\" and\n"
        "\"end_sec\" columns, as the manifests written by segment-audio-dir\n"
        "have.  Writes a new manifest for the cut segments to <output-dir>.\n"
        "\n"
        "Usage:  cut-segments [options] <audio-file> <segments-csv> "
        "<output-dir>\n"
        "e.g.: cut-segments talk.wav out/talk_segment/segment_all.csv "
        "recut\n"
        "See also: segment-audio-dir, compute-speech-segments\n";

    ParseOptions po(usage);
    CutterOptions cutter_opts;
    MediaToolOptions tool_opts;

    cutter_opts.Register(&po);
    tool_opts.Register(&po);

    po.Read(argc, argv);

    if (po.NumArgs() != 3) {
      po.PrintUsage();
      exit(1);
    }

    std::string audio_file = po.GetArg(1),
        segments_csv = po.GetArg(2),
        output_dir = po.GetArg(3);

    std::vector<ManifestRow> rows;
    if (!ReadManifest(segments_csv, &rows))
      SPEECHSEG_ERR << "Could not read segments from " << segments_csv;
    SegmentList segments;
    for (size_t i = 0; i < rows.size(); i++)
      segments.push_back(SpeechSegment(rows[i].start_sec, rows[i].end_sec));

    MediaToolchain tools(tool_opts);
    SegmentCutter cutter(cutter_opts, tools.Primary());
    CutStats stats;
    if (!cutter.Cut(audio_file, output_dir, segments, NULL, &stats))
      SPEECHSEG_ERR << "Could not write segments to " << output_dir;

    SPEECHSEG_LOG << "Cut " << stats.num_written << " of "
                  << stats.num_requested << " segments of " << audio_file
                  << " into " << output_dir;
    return (stats.num_failed == 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
