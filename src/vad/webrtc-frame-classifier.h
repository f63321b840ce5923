// vad/webrtc-frame-classifier.h

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

#ifndef SPEECHSEG_VAD_WEBRTC_FRAME_CLASSIFIER_H_
#define SPEECHSEG_VAD_WEBRTC_FRAME_CLASSIFIER_H_

#include "vad/frame-classifier.h"

// Forward declaration from <fvad.h>, so that users of this header do not
// need the libfvad headers.
struct Fvad;

namespace speechseg {

/// The WebRTC voice activity detector, through libfvad.  Aggressiveness maps
/// directly to the libfvad mode (0 to 3).
class WebRtcFrameClassifier: public FrameClassifier {
 public:
  WebRtcFrameClassifier(int32 aggressiveness, int32 sample_rate,
                        int32 frame_ms);

  virtual bool IsSpeech(const int16 *frame, int32 num_samples);

  virtual int32 FrameLength() const { return frame_length_; }

  virtual void Reset();

  virtual ~WebRtcFrameClassifier();

 private:
  Fvad *vad_;
  int32 aggressiveness_;
  int32 sample_rate_;
  int32 frame_length_;

  SPEECHSEG_DISALLOW_COPY_AND_ASSIGN(WebRtcFrameClassifier);
};

}  // namespace speechseg

#endif  // SPEECHSEG_VAD_WEBRTC_FRAME_CLASSIFIER_H_
