// vad/segment-merger.h

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

#ifndef SPEECHSEG_VAD_SEGMENT_MERGER_H_
#define SPEECHSEG_VAD_SEGMENT_MERGER_H_

#include "base/speechseg-common.h"
#include "util/options-itf.h"
#include "vad/speech-segment.h"

namespace speechseg {

struct MergeOptions {
  double min_len;  // seconds

  MergeOptions(): min_len(0.0) { }

  void Register(OptionsItf *opts) {
    opts->Register("min-len", &min_len, "Segments shorter than this many "
                   "seconds are joined with the segment that follows them "
                   "(0 disables merging)");
  }

  void Check() const {
    if (min_len < 0.0)
      SPEECHSEG_ERR << "Invalid --min-len=" << min_len;
  }
};

/**
   Joins short segments with their successors, greedily, from left to right.

   The first segment starts the output.  Each following segment is absorbed
   into the last output segment if that one is shorter than min_len: the last
   output segment's end moves to the absorbed segment's end, and the gap
   between them becomes part of it.  Otherwise the segment is appended.
   Afterwards, if there is more than one output segment and the last one is
   still shorter than min_len, it is absorbed into the one before it in the
   same way.

   Segments are only ever grown, never split, so the output has at most as
   many segments as the input.  With min_len == 0 the output equals the
   input; empty and single-segment inputs are returned unchanged.
 */
void MergeShortSegments(const SegmentList &segments, double min_len,
                        SegmentList *merged);

}  // namespace speechseg

#endif  // SPEECHSEG_VAD_SEGMENT_MERGER_H_
