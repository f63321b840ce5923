// vad/speech-segment.h

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

#ifndef SPEECHSEG_VAD_SPEECH_SEGMENT_H_
#define SPEECHSEG_VAD_SPEECH_SEGMENT_H_

#include <ostream>
#include <vector>

#include "base/speechseg-common.h"

namespace speechseg {

/// A time range of a recording, in seconds.  All three fields are kept
/// rounded to the millisecond, and duration_sec is always
/// RoundToMillis(end_sec - start_sec).
struct SpeechSegment {
  double start_sec;
  double end_sec;
  double duration_sec;

  SpeechSegment(): start_sec(0.0), end_sec(0.0), duration_sec(0.0) { }

  SpeechSegment(double start, double end):
      start_sec(RoundToMillis(start)), end_sec(RoundToMillis(end)),
      duration_sec(RoundToMillis(end_sec - start_sec)) { }

  bool operator == (const SpeechSegment &other) const {
    return start_sec == other.start_sec && end_sec == other.end_sec &&
        duration_sec == other.duration_sec;
  }
};

typedef std::vector<SpeechSegment> SegmentList;

inline std::ostream &operator << (std::ostream &os, const SpeechSegment &s) {
  return os << "[" << s.start_sec << ", " << s.end_sec << "] ("
            << s.duration_sec << "s)";
}

}  // namespace speechseg

#endif  // SPEECHSEG_VAD_SPEECH_SEGMENT_H_
