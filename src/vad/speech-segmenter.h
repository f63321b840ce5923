// vad/speech-segmenter.h

// Copyright 2013  Daniel Povey
//           2026  The speechseg Authors

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

#ifndef SPEECHSEG_VAD_SPEECH_SEGMENTER_H_
#define SPEECHSEG_VAD_SPEECH_SEGMENTER_H_

#include <string>
#include <vector>

#include "base/speechseg-common.h"
#include "util/options-itf.h"
#include "vad/frame-classifier.h"
#include "vad/speech-segment.h"

namespace speechseg {

/// Segments shorter than this are never emitted, whatever the options say.
const double kMinRawSegmentSec = 0.2;

struct VadOptions {
  FrameClassifierOptions classifier_opts;
  int32 frame_duration;   // in milliseconds
  int32 min_silence_ms;
  int32 min_segment_ms;

  VadOptions(): frame_duration(30), min_silence_ms(1000),
                min_segment_ms(200) { }

  void Register(OptionsItf *opts) {
    classifier_opts.Register(opts);
    opts->Register("frame-duration", &frame_duration, "Length of a VAD "
                   "frame in milliseconds (10, 20 or 30)");
    opts->Register("min-silence-ms", &min_silence_ms, "Length of the run of "
                   "non-speech, in milliseconds, that ends a segment");
    opts->Register("min-segment-ms", &min_segment_ms, "Minimum length, in "
                   "milliseconds, of a segment still open when the "
                   "recording ends");
  }

  /// Number of consecutive non-speech frames that close a segment.
  int32 MinSilenceFrames() const { return min_silence_ms / frame_duration; }

  double FrameShiftSec() const { return frame_duration / 1000.0; }

  void Check() const;
};

/**
   SpeechSegmenter turns a stream of per-frame speech/non-speech decisions
   into speech segments.  It has two states, idle and in-speech.

   Frame t covers time t * frame_duration.  A speech frame seen while idle
   opens a segment at its own time.  While in speech, each non-speech frame
   extends the current silence run and each speech frame resets it.  When the
   run reaches MinSilenceFrames() the segment closes at
   (t - run_length) * frame_duration, t being the frame that completed the
   run, so the trailing silence is not part of it.  It is emitted if it
   lasts at least kMinRawSegmentSec.

   At the end of the stream an open segment closes at
   NumFrames() * frame_duration, with no back-off, and is emitted if it lasts
   at least min_segment_ms (and kMinRawSegmentSec).
 */
class SpeechSegmenter {
 public:
  explicit SpeechSegmenter(const VadOptions &opts);

  /// Processes the next frame's decision.
  void AcceptFrame(bool is_speech);

  /// Signals the end of the stream.  No frames may be accepted afterwards.
  void Finish();

  /// Segments emitted so far, in time order.
  const SegmentList &Segments() const { return segments_; }

  int32 NumFrames() const { return num_frames_; }

  bool InSpeech() const { return in_speech_; }

  bool IsFinished() const { return finished_; }

 private:
  double FrameTime(int32 t) const {
    return static_cast<double>(t) * frame_duration_ms_ / 1000.0;
  }
  void MaybeEmit(double start, double end, double min_duration);

  int32 frame_duration_ms_;
  int32 min_silence_frames_;
  double min_tail_sec_;

  int32 num_frames_;
  bool in_speech_;
  int32 segment_start_frame_;
  int32 silence_count_;
  bool finished_;
  SegmentList segments_;
};

/// Splits "samples" (mono, 16-bit) into whole frames of
/// classifier->FrameLength() samples, classifies each one and runs them
/// through a SpeechSegmenter.  A partial frame at the end is dropped.
void ComputeSpeechSegments(const VadOptions &opts,
                           const std::vector<int16> &samples,
                           FrameClassifier *classifier,
                           SegmentList *segments);

}  // namespace speechseg

#endif  // SPEECHSEG_VAD_SPEECH_SEGMENTER_H_
