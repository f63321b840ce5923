// vad/segment-merger.cc

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

#include "vad/segment-merger.h"

namespace speechseg {

void MergeShortSegments(const SegmentList &segments, double min_len,
                        SegmentList *merged) {
  SPEECHSEG_ASSERT(merged != NULL && merged != &segments);
  merged->clear();
  if (segments.empty()) return;

  merged->push_back(segments[0]);
  for (size_t i = 1; i < segments.size(); i++) {
    SpeechSegment &last = merged->back();
    if (last.duration_sec < min_len) {
      last = SpeechSegment(last.start_sec, segments[i].end_sec);
    } else {
      merged->push_back(segments[i]);
    }
  }

  if (merged->size() > 1 && merged->back().duration_sec < min_len) {
    SpeechSegment tail = merged->back();
    merged->pop_back();
    SpeechSegment &last = merged->back();
    last = SpeechSegment(last.start_sec, tail.end_sec);
  }

  if (merged->size() != segments.size())
    SPEECHSEG_VLOG(2) << "Merged " << segments.size() << " segments into "
                      << merged->size() << " (min-len " << min_len << "s)";
}

}  // namespace speechseg
