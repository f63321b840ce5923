// vad/speech-segmenter-test.cc

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
#include "vad/speech-segmenter.h"

namespace speechseg {

// Feeds a pattern such as "50s40n10s" (counts of speech/non-speech frames)
// through a segmenter.
static void RunPattern(const VadOptions &opts, const std::string &pattern,
                       SegmentList *segments) {
  SpeechSegmenter segmenter(opts);
  size_t pos = 0;
  while (pos < pattern.size()) {
    char *end;
    long count = strtol(pattern.c_str() + pos, &end, 10);
    pos = end - pattern.c_str();
    SPEECHSEG_ASSERT(pos < pattern.size());
    bool is_speech = (pattern[pos] == 's');
    pos++;
    for (long i = 0; i < count; i++)
      segmenter.AcceptFrame(is_speech);
  }
  segmenter.Finish();
  SPEECHSEG_ASSERT(!segmenter.InSpeech() && segmenter.IsFinished());
  *segments = segmenter.Segments();
}

static bool Near(double a, double b) {
  return std::abs(a - b) < 1.0e-09;
}

// 30 ms frames and 1000 ms of silence: 33 frames close a segment.
void UnitTestSilenceAndTailClosure() {
  VadOptions opts;
  SPEECHSEG_ASSERT(opts.MinSilenceFrames() == 33);
  SegmentList segments;
  RunPattern(opts, "50s40n10s", &segments);
  SPEECHSEG_ASSERT(segments.size() == 2);
  // Closed by silence: the run completes at frame 82, so the segment ends at
  // (82 - 33) * 0.03.
  SPEECHSEG_ASSERT(Near(segments[0].start_sec, 0.0));
  SPEECHSEG_ASSERT(Near(segments[0].end_sec, 1.47));
  SPEECHSEG_ASSERT(Near(segments[0].duration_sec, 1.47));
  // Closed by the end of the stream, with no back-off.
  SPEECHSEG_ASSERT(Near(segments[1].start_sec, 2.7));
  SPEECHSEG_ASSERT(Near(segments[1].end_sec, 3.0));
  SPEECHSEG_ASSERT(Near(segments[1].duration_sec, 0.3));
}

void UnitTestSilenceRunResets() {
  VadOptions opts;
  SegmentList segments;
  // 32 non-speech frames do not close the segment; speech resets the count.
  RunPattern(opts, "10s32n10s32n10s40n", &segments);
  SPEECHSEG_ASSERT(segments.size() == 1);
  SPEECHSEG_ASSERT(Near(segments[0].start_sec, 0.0));
  // Last speech frame is 93; the run of 33 completes at frame 126.
  SPEECHSEG_ASSERT(Near(segments[0].end_sec, 2.79));
  SPEECHSEG_ASSERT(Near(segments[0].duration_sec, 2.79));
}

void UnitTestShortSegmentsDropped() {
  VadOptions opts;
  SegmentList segments;
  // A segment closed by silence ends at the time of its last speech frame,
  // so 7 speech frames give 0.18 s (dropped) and 8 give 0.21 s.
  RunPattern(opts, "7s40n8s40n", &segments);
  SPEECHSEG_ASSERT(segments.size() == 1);
  SPEECHSEG_ASSERT(Near(segments[0].start_sec, 1.41));
  SPEECHSEG_ASSERT(Near(segments[0].duration_sec, 0.21));

  // The floor applies even when silence closure backs off to a short span.
  opts.min_silence_ms = 300;  // 10 frames
  RunPattern(opts, "5s10n", &segments);
  SPEECHSEG_ASSERT(segments.empty());
}

void UnitTestTailThreshold() {
  VadOptions opts;
  opts.min_segment_ms = 500;
  SegmentList segments;
  // A 0.3 s tail is below --min-segment-ms.
  RunPattern(opts, "50s40n10s", &segments);
  SPEECHSEG_ASSERT(segments.size() == 1);
  // 20 frames = 0.6 s is enough.
  RunPattern(opts, "50s40n20s", &segments);
  SPEECHSEG_ASSERT(segments.size() == 2);
  SPEECHSEG_ASSERT(Near(segments[1].end_sec, 110 * 0.03));

  // A tail below the unconditional floor is dropped even if
  // --min-segment-ms is lower.
  opts.min_segment_ms = 0;
  RunPattern(opts, "50s40n6s", &segments);
  SPEECHSEG_ASSERT(segments.size() == 1);
  for (size_t i = 0; i < segments.size(); i++)
    SPEECHSEG_ASSERT(segments[i].duration_sec >= kMinRawSegmentSec);
}

void UnitTestEdgeCases() {
  VadOptions opts;
  SegmentList segments;
  RunPattern(opts, "", &segments);
  SPEECHSEG_ASSERT(segments.empty());
  RunPattern(opts, "100n", &segments);
  SPEECHSEG_ASSERT(segments.empty());
  RunPattern(opts, "100s", &segments);
  SPEECHSEG_ASSERT(segments.size() == 1 && Near(segments[0].end_sec, 3.0));
  // A segment that ends exactly when the run completes at the last frame is
  // closed by silence, not by the end of the stream.
  RunPattern(opts, "20s33n", &segments);
  SPEECHSEG_ASSERT(segments.size() == 1 && Near(segments[0].end_sec, 0.57));

  // 10 ms frames.
  opts.frame_duration = 10;
  opts.min_silence_ms = 105;  // floor(105 / 10) = 10 frames
  SPEECHSEG_ASSERT(opts.MinSilenceFrames() == 10);
  RunPattern(opts, "5n30s10n", &segments);
  SPEECHSEG_ASSERT(segments.size() == 1);
  SPEECHSEG_ASSERT(Near(segments[0].start_sec, 0.05));
  SPEECHSEG_ASSERT(Near(segments[0].end_sec, 0.34));
}

// Classifies frames from a script instead of from the audio.
class ScriptedClassifier: public FrameClassifier {
 public:
  ScriptedClassifier(const std::vector<bool> &script, int32 frame_length):
      script_(script), frame_length_(frame_length), next_(0) { }
  virtual bool IsSpeech(const int16 *frame, int32 num_samples) {
    SPEECHSEG_ASSERT(num_samples == frame_length_);
    SPEECHSEG_ASSERT(next_ < script_.size());
    return script_[next_++];
  }
  virtual int32 FrameLength() const { return frame_length_; }
  size_t NumCalls() const { return next_; }
 private:
  std::vector<bool> script_;
  int32 frame_length_;
  size_t next_;
};

void UnitTestComputeSpeechSegments() {
  VadOptions opts;
  int32 frame_length = FrameLengthInSamples(16000, 30);
  SPEECHSEG_ASSERT(frame_length == 480);
  std::vector<bool> script;
  for (int32 i = 0; i < 100; i++)
    script.push_back(i < 50 || i >= 90);
  ScriptedClassifier classifier(script, frame_length);
  // 100 whole frames plus a partial one that must not be classified.
  std::vector<int16> samples(100 * frame_length + 100, 0);
  SegmentList segments;
  ComputeSpeechSegments(opts, samples, &classifier, &segments);
  SPEECHSEG_ASSERT(classifier.NumCalls() == 100);
  SPEECHSEG_ASSERT(segments.size() == 2);
  SPEECHSEG_ASSERT(Near(segments[0].end_sec, 1.47));
  SPEECHSEG_ASSERT(Near(segments[1].start_sec, 2.7));
  SPEECHSEG_ASSERT(Near(segments[1].end_sec, 3.0));
}

void UnitTestEnergyClassifierSegments() {
  VadOptions opts;
  opts.classifier_opts.vad_type = "energy";
  const int32 rate = 8000, frame_length = FrameLengthInSamples(rate, 30);
  std::vector<int16> samples;
  // 1.5 s of a loud square wave, 1.2 s of near silence, 0.3 s loud.
  for (int32 f = 0; f < 100; f++) {
    bool loud = (f < 50 || f >= 90);
    for (int32 i = 0; i < frame_length; i++)
      samples.push_back(loud ? ((i / 8) % 2 ? 8000 : -8000) : (i % 2));
  }
  FrameClassifier *classifier =
      NewFrameClassifier(opts.classifier_opts, rate, opts.frame_duration);
  SegmentList segments;
  ComputeSpeechSegments(opts, samples, classifier, &segments);
  delete classifier;
  SPEECHSEG_ASSERT(segments.size() == 2);
  SPEECHSEG_ASSERT(Near(segments[0].end_sec, 1.47));
  SPEECHSEG_ASSERT(Near(segments[1].duration_sec, 0.3));
}

void UnitTestCheck() {
  VadOptions opts;
  opts.Check();
  opts.frame_duration = 25;
  bool threw = false;
  try {
    opts.Check();
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
  opts.frame_duration = 30;
  opts.classifier_opts.aggressiveness = 4;
  threw = false;
  try {
    opts.Check();
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestSilenceAndTailClosure();
  UnitTestSilenceRunResets();
  UnitTestShortSegmentsDropped();
  UnitTestTailThreshold();
  UnitTestEdgeCases();
  UnitTestComputeSpeechSegments();
  UnitTestEnergyClassifierSegments();
  UnitTestCheck();
  std::cout << "Test OK.\n";
  return 0;
}
