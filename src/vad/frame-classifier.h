// vad/frame-classifier.h

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

#ifndef SPEECHSEG_VAD_FRAME_CLASSIFIER_H_
#define SPEECHSEG_VAD_FRAME_CLASSIFIER_H_

#include <string>

#include "base/speechseg-common.h"
#include "util/options-itf.h"

namespace speechseg {

struct FrameClassifierOptions {
  std::string vad_type;
  int32 aggressiveness;
  BaseFloat energy_threshold;

  FrameClassifierOptions(): vad_type("webrtc"), aggressiveness(2),
                            energy_threshold(-40.0) { }

  void Register(OptionsItf *opts) {
    opts->Register("vad-type", &vad_type, "Frame classifier to use: "
                   "\"webrtc\" (the WebRTC VAD, via libfvad) or \"energy\" "
                   "(a log-energy threshold)");
    opts->Register("aggressiveness", &aggressiveness, "VAD aggressiveness, "
                   "0 (least likely to call a frame non-speech) to 3 (most "
                   "likely)");
    opts->Register("energy-threshold", &energy_threshold, "For "
                   "--vad-type=energy: frames at least this loud, in dB "
                   "relative to full scale, are speech at "
                   "--aggressiveness=2; each level above or below 2 moves "
                   "the threshold up or down by 3 dB");
  }

  /// Dies with SPEECHSEG_ERR if the options cannot work.
  void Check() const;
};

/**
   FrameClassifier is the interface for per-frame speech/non-speech
   decisions.  A classifier is created for one stream (one sample rate and
   frame length) and is given that stream's frames in order; it may keep
   state between frames, so it must not be shared between streams or
   threads.
 */
class FrameClassifier {
 public:
  /// Returns true if the frame is speech.  "num_samples" must equal
  /// FrameLength(); anything else is a programming error.
  virtual bool IsSpeech(const int16 *frame, int32 num_samples) = 0;

  /// Number of samples in one frame.
  virtual int32 FrameLength() const = 0;

  /// Forgets any state carried between frames.
  virtual void Reset() { }

  virtual ~FrameClassifier() { }
};

/// Returns true if frames of "frame_ms" milliseconds at "sample_rate" can be
/// classified: rate one of 8000, 16000, 32000, 48000 and length one of 10,
/// 20, 30 ms.
bool IsSupportedFrameFormat(int32 sample_rate, int32 frame_ms);

/// Number of samples in a frame of "frame_ms" milliseconds.
inline int32 FrameLengthInSamples(int32 sample_rate, int32 frame_ms) {
  return sample_rate / 1000 * frame_ms;
}

/**
   A classifier that compares the frame's mean power, in dB relative to a
   full-scale square wave, with a threshold.  Useful where the WebRTC VAD is
   not wanted, and in tests, since its decisions are easy to predict.
 */
class EnergyFrameClassifier: public FrameClassifier {
 public:
  EnergyFrameClassifier(const FrameClassifierOptions &opts,
                        int32 sample_rate, int32 frame_ms);

  virtual bool IsSpeech(const int16 *frame, int32 num_samples);

  virtual int32 FrameLength() const { return frame_length_; }

  /// Threshold actually applied, after the aggressiveness offset.
  BaseFloat ThresholdDb() const { return threshold_db_; }

  /// Mean power of the samples in dB relative to full scale; -100 for an
  /// all-zero frame.
  static BaseFloat FrameEnergyDb(const int16 *frame, int32 num_samples);

 private:
  int32 frame_length_;
  BaseFloat threshold_db_;
};

/// Creates the classifier named by opts.vad_type for a stream of the given
/// rate and frame length.  Dies with SPEECHSEG_ERR if the type is unknown or
/// the format is unsupported.  The caller owns the result.
FrameClassifier *NewFrameClassifier(const FrameClassifierOptions &opts,
                                    int32 sample_rate, int32 frame_ms);

}  // namespace speechseg

#endif  // SPEECHSEG_VAD_FRAME_CLASSIFIER_H_
