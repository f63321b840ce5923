// vad/segment-merger-test.cc

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

#include <cmath>
#include <cstdlib>

#include "base/speechseg-common.h"
#include "vad/segment-merger.h"

namespace speechseg {

static bool Near(double a, double b) {
  return std::abs(a - b) < 1.0e-09;
}

void UnitTestEmptyAndSingle() {
  SegmentList in, out;
  MergeShortSegments(in, 5.0, &out);
  SPEECHSEG_ASSERT(out.empty());

  in.push_back(SpeechSegment(1.0, 1.3));
  MergeShortSegments(in, 5.0, &out);
  SPEECHSEG_ASSERT(out == in);
}

void UnitTestZeroIsNoOp() {
  SegmentList in, out;
  in.push_back(SpeechSegment(0.0, 0.21));
  in.push_back(SpeechSegment(0.5, 0.9));
  in.push_back(SpeechSegment(2.0, 2.25));
  MergeShortSegments(in, 0.0, &out);
  SPEECHSEG_ASSERT(out == in);
}

void UnitTestGreedyForward() {
  SegmentList in, out;
  in.push_back(SpeechSegment(0.0, 1.0));   // 1.0 s, short
  in.push_back(SpeechSegment(1.5, 2.0));   // absorbed: [0, 2.0], 2.0 s
  in.push_back(SpeechSegment(2.5, 5.0));   // absorbed: [0, 5.0], 5.0 s
  in.push_back(SpeechSegment(6.0, 6.5));   // previous is long enough
  in.push_back(SpeechSegment(7.0, 12.0));  // absorbed: [6.0, 12.0]
  MergeShortSegments(in, 3.0, &out);
  SPEECHSEG_ASSERT(out.size() == 2);
  SPEECHSEG_ASSERT(Near(out[0].start_sec, 0.0) && Near(out[0].end_sec, 5.0));
  SPEECHSEG_ASSERT(Near(out[0].duration_sec, 5.0));
  SPEECHSEG_ASSERT(Near(out[1].start_sec, 6.0) && Near(out[1].end_sec, 12.0));
  SPEECHSEG_ASSERT(Near(out[1].duration_sec, 6.0));
}

void UnitTestTailFold() {
  SegmentList in, out;
  in.push_back(SpeechSegment(0.0, 4.0));
  in.push_back(SpeechSegment(5.0, 9.0));
  in.push_back(SpeechSegment(9.5, 10.0));  // short tail
  MergeShortSegments(in, 3.0, &out);
  SPEECHSEG_ASSERT(out.size() == 2);
  SPEECHSEG_ASSERT(Near(out[1].start_sec, 5.0) && Near(out[1].end_sec, 10.0));
  SPEECHSEG_ASSERT(Near(out[1].duration_sec, 5.0));

  // A single short result stays as it is.
  in.clear();
  in.push_back(SpeechSegment(0.0, 0.5));
  in.push_back(SpeechSegment(0.7, 1.0));
  MergeShortSegments(in, 3.0, &out);
  SPEECHSEG_ASSERT(out.size() == 1);
  SPEECHSEG_ASSERT(Near(out[0].end_sec, 1.0) && out[0].duration_sec < 3.0);
}

void UnitTestProperties() {
  // Pseudo-random segment lists: merging never adds segments, and only the
  // last output segment may be short.
  srand(7);
  for (int32 iter = 0; iter < 200; iter++) {
    SegmentList in, out;
    double t = 0.0;
    int32 n = rand() % 12;
    for (int32 i = 0; i < n; i++) {
      t += 0.01 * (rand() % 300);
      double start = t;
      t += 0.2 + 0.01 * (rand() % 500);
      in.push_back(SpeechSegment(start, t));
    }
    double min_len = 0.1 * (rand() % 60);
    MergeShortSegments(in, min_len, &out);
    SPEECHSEG_ASSERT(out.size() <= in.size());
    if (in.empty()) continue;
    SPEECHSEG_ASSERT(Near(out.front().start_sec, in.front().start_sec));
    SPEECHSEG_ASSERT(Near(out.back().end_sec, in.back().end_sec));
    for (size_t i = 0; i < out.size(); i++) {
      if (i + 1 < out.size()) {
        SPEECHSEG_ASSERT(out[i].duration_sec >= min_len);
        SPEECHSEG_ASSERT(out[i].end_sec <= out[i + 1].start_sec);
      }
      SPEECHSEG_ASSERT(Near(out[i].duration_sec,
                            RoundToMillis(out[i].end_sec - out[i].start_sec)));
    }
    if (out.size() > 1)
      SPEECHSEG_ASSERT(out.back().duration_sec >= min_len);
  }
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestEmptyAndSingle();
  UnitTestZeroIsNoOp();
  UnitTestGreedyForward();
  UnitTestTailFold();
  UnitTestProperties();
  std::cout << "Test OK.\n";
  return 0;
}
