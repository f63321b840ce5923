// vad/frame-classifier-test.cc

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

#include "base/speechseg-common.h"
#include "vad/frame-classifier.h"
#include "vad/webrtc-frame-classifier.h"

namespace speechseg {

static bool ThrowsFatal(const FrameClassifierOptions &opts, int32 rate,
                        int32 frame_ms) {
  try {
    FrameClassifier *c = NewFrameClassifier(opts, rate, frame_ms);
    delete c;
  } catch (const SpeechsegFatalError &e) {
    return true;
  }
  return false;
}

void UnitTestFrameFormats() {
  SPEECHSEG_ASSERT(IsSupportedFrameFormat(8000, 10));
  SPEECHSEG_ASSERT(IsSupportedFrameFormat(48000, 30));
  SPEECHSEG_ASSERT(!IsSupportedFrameFormat(44100, 30));
  SPEECHSEG_ASSERT(!IsSupportedFrameFormat(16000, 25));
  SPEECHSEG_ASSERT(FrameLengthInSamples(8000, 10) == 80);
  SPEECHSEG_ASSERT(FrameLengthInSamples(48000, 20) == 960);
}

void UnitTestFrameEnergy() {
  std::vector<int16> frame(160, 0);
  SPEECHSEG_ASSERT(EnergyFrameClassifier::FrameEnergyDb(&frame[0], 160) ==
                   -100.0);
  // Full-scale square wave: 0 dB (to within the 32767 vs 32768 difference).
  for (size_t i = 0; i < frame.size(); i++)
    frame[i] = (i % 2 ? 32767 : -32767);
  BaseFloat db = EnergyFrameClassifier::FrameEnergyDb(&frame[0], 160);
  SPEECHSEG_ASSERT(std::abs(db) < 0.01);
  // Halving the amplitude loses about 6 dB.
  for (size_t i = 0; i < frame.size(); i++)
    frame[i] = (i % 2 ? 16384 : -16384);
  db = EnergyFrameClassifier::FrameEnergyDb(&frame[0], 160);
  SPEECHSEG_ASSERT(std::abs(db + 6.0206) < 0.01);
}

void UnitTestEnergyThreshold() {
  FrameClassifierOptions opts;
  opts.vad_type = "energy";
  EnergyFrameClassifier c2(opts, 8000, 20);
  SPEECHSEG_ASSERT(c2.FrameLength() == 160);
  SPEECHSEG_ASSERT(std::abs(c2.ThresholdDb() + 40.0) < 1.0e-04);
  opts.aggressiveness = 3;
  EnergyFrameClassifier c3(opts, 8000, 20);
  SPEECHSEG_ASSERT(std::abs(c3.ThresholdDb() + 37.0) < 1.0e-04);
  opts.aggressiveness = 0;
  EnergyFrameClassifier c0(opts, 8000, 20);
  SPEECHSEG_ASSERT(std::abs(c0.ThresholdDb() + 46.0) < 1.0e-04);

  // A square wave of amplitude 328 is about -40 dB; 400 is about -38.3 dB.
  std::vector<int16> frame(160);
  for (size_t i = 0; i < frame.size(); i++)
    frame[i] = (i % 2 ? 400 : -400);
  SPEECHSEG_ASSERT(c2.IsSpeech(&frame[0], 160));
  SPEECHSEG_ASSERT(!c3.IsSpeech(&frame[0], 160));
  SPEECHSEG_ASSERT(c0.IsSpeech(&frame[0], 160));

  // A frame exactly at the threshold is speech.
  opts.aggressiveness = 2;
  opts.energy_threshold = EnergyFrameClassifier::FrameEnergyDb(&frame[0], 160);
  EnergyFrameClassifier at(opts, 8000, 20);
  SPEECHSEG_ASSERT(at.ThresholdDb() == opts.energy_threshold);
  SPEECHSEG_ASSERT(at.IsSpeech(&frame[0], 160));
  frame[0] = 399;
  SPEECHSEG_ASSERT(!at.IsSpeech(&frame[0], 160));
  frame[0] = -400;

  bool threw = false;
  try {
    c2.IsSpeech(&frame[0], 100);
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

void UnitTestFactory() {
  FrameClassifierOptions opts;
  opts.vad_type = "energy";
  FrameClassifier *c = NewFrameClassifier(opts, 16000, 30);
  SPEECHSEG_ASSERT(c->FrameLength() == 480);
  SPEECHSEG_ASSERT(dynamic_cast<EnergyFrameClassifier*>(c) != NULL);
  delete c;

  SPEECHSEG_ASSERT(ThrowsFatal(opts, 44100, 30));
  SPEECHSEG_ASSERT(ThrowsFatal(opts, 16000, 15));
  opts.vad_type = "neural";
  SPEECHSEG_ASSERT(ThrowsFatal(opts, 16000, 30));
  opts.vad_type = "webrtc";
  opts.aggressiveness = -1;
  SPEECHSEG_ASSERT(ThrowsFatal(opts, 16000, 30));
}

void UnitTestWebRtc() {
  FrameClassifierOptions opts;
  for (int32 mode = 0; mode <= 3; mode++) {
    opts.aggressiveness = mode;
    FrameClassifier *c = NewFrameClassifier(opts, 16000, 10);
    SPEECHSEG_ASSERT(dynamic_cast<WebRtcFrameClassifier*>(c) != NULL);
    SPEECHSEG_ASSERT(c->FrameLength() == 160);
    std::vector<int16> silence(160, 0);
    for (int32 i = 0; i < 20; i++)
      SPEECHSEG_ASSERT(!c->IsSpeech(&silence[0], 160));
    c->Reset();
    SPEECHSEG_ASSERT(!c->IsSpeech(&silence[0], 160));
    bool threw = false;
    try {
      c->IsSpeech(&silence[0], 80);
    } catch (const SpeechsegFatalError &e) {
      threw = true;
    }
    SPEECHSEG_ASSERT(threw);
    delete c;
  }
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestFrameFormats();
  UnitTestFrameEnergy();
  UnitTestEnergyThreshold();
  UnitTestFactory();
  UnitTestWebRtc();
  std::cout << "Test OK.\n";
  return 0;
}
