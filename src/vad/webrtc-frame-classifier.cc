// vad/webrtc-frame-classifier.cc

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

#include "vad/webrtc-frame-classifier.h"

#include <fvad.h>

namespace speechseg {

WebRtcFrameClassifier::WebRtcFrameClassifier(int32 aggressiveness,
                                             int32 sample_rate,
                                             int32 frame_ms):
    vad_(NULL), aggressiveness_(aggressiveness), sample_rate_(sample_rate),
    frame_length_(FrameLengthInSamples(sample_rate, frame_ms)) {
  if (!IsSupportedFrameFormat(sample_rate, frame_ms))
    SPEECHSEG_ERR << "The WebRTC VAD cannot handle " << frame_ms
                  << " ms frames at " << sample_rate << " Hz";
  vad_ = fvad_new();
  if (vad_ == NULL)
    SPEECHSEG_ERR << "fvad_new() failed (out of memory?)";
  Reset();
}

void WebRtcFrameClassifier::Reset() {
  fvad_reset(vad_);
  // fvad_reset() also restores the default mode and rate.
  if (fvad_set_mode(vad_, aggressiveness_) < 0 ||
      fvad_set_sample_rate(vad_, sample_rate_) < 0) {
    fvad_free(vad_);
    vad_ = NULL;
    SPEECHSEG_ERR << "libfvad rejected mode " << aggressiveness_
                  << " or sample rate " << sample_rate_;
  }
}

bool WebRtcFrameClassifier::IsSpeech(const int16 *frame, int32 num_samples) {
  if (num_samples != frame_length_)
    SPEECHSEG_ERR << "Frame has " << num_samples << " samples, expected "
                  << frame_length_;
  int ans = fvad_process(vad_, frame, num_samples);
  if (ans < 0)
    SPEECHSEG_ERR << "fvad_process() failed on a frame of " << num_samples
                  << " samples at " << sample_rate_ << " Hz";
  return ans == 1;
}

WebRtcFrameClassifier::~WebRtcFrameClassifier() {
  if (vad_ != NULL)
    fvad_free(vad_);
}

}  // namespace speechseg
