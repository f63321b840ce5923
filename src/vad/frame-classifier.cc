// vad/frame-classifier.cc

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

#include "vad/frame-classifier.h"

#include <cmath>

#include "vad/webrtc-frame-classifier.h"

namespace speechseg {

void FrameClassifierOptions::Check() const {
  if (vad_type != "webrtc" && vad_type != "energy")
    SPEECHSEG_ERR << "Invalid --vad-type=" << vad_type
                  << ", expected webrtc or energy";
  if (aggressiveness < 0 || aggressiveness > 3)
    SPEECHSEG_ERR << "Invalid --aggressiveness=" << aggressiveness
                  << ", expected 0, 1, 2 or 3";
}

bool IsSupportedFrameFormat(int32 sample_rate, int32 frame_ms) {
  bool rate_ok = (sample_rate == 8000 || sample_rate == 16000 ||
                  sample_rate == 32000 || sample_rate == 48000);
  bool length_ok = (frame_ms == 10 || frame_ms == 20 || frame_ms == 30);
  return rate_ok && length_ok;
}

EnergyFrameClassifier::EnergyFrameClassifier(
    const FrameClassifierOptions &opts, int32 sample_rate, int32 frame_ms):
    frame_length_(FrameLengthInSamples(sample_rate, frame_ms)),
    threshold_db_(opts.energy_threshold + 3.0 * (opts.aggressiveness - 2)) {
  SPEECHSEG_ASSERT(frame_length_ > 0);
}

BaseFloat EnergyFrameClassifier::FrameEnergyDb(const int16 *frame,
                                               int32 num_samples) {
  double sumsq = 0.0;
  for (int32 i = 0; i < num_samples; i++)
    sumsq += static_cast<double>(frame[i]) * frame[i];
  if (num_samples == 0 || sumsq == 0.0) return -100.0;
  const double kFullScale = 32768.0;
  double power = sumsq / num_samples / (kFullScale * kFullScale);
  return static_cast<BaseFloat>(10.0 * std::log10(power));
}

bool EnergyFrameClassifier::IsSpeech(const int16 *frame, int32 num_samples) {
  if (num_samples != frame_length_)
    SPEECHSEG_ERR << "Frame has " << num_samples << " samples, expected "
                  << frame_length_;
  return FrameEnergyDb(frame, num_samples) >= threshold_db_;
}

FrameClassifier *NewFrameClassifier(const FrameClassifierOptions &opts,
                                    int32 sample_rate, int32 frame_ms) {
  opts.Check();
  if (!IsSupportedFrameFormat(sample_rate, frame_ms))
    SPEECHSEG_ERR << "Cannot classify " << frame_ms << " ms frames at "
                  << sample_rate << " Hz";
  if (opts.vad_type == "energy")
    return new EnergyFrameClassifier(opts, sample_rate, frame_ms);
  return new WebRtcFrameClassifier(opts.aggressiveness, sample_rate, frame_ms);
}

}  // namespace speechseg
