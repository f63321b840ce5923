// media/wave-backend-test.cc

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

#include <unistd.h>

#include <cstdlib>

#include "audio/wave-reader.h"
#include "media/wave-backend.h"
#include "util/file-utils.h"

namespace speechseg {

static std::string MakeTempDir() {
  char tmpl[] = "/tmp/speechseg-wave-backend-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  return tmpl;
}

// Stereo, 8 kHz, 1 second; left channel counts up, right channel is -left.
static void WriteStereo(const std::string &filename) {
  std::vector<int16> samples;
  for (int32 i = 0; i < 8000; i++) {
    samples.push_back(i % 1000);
    samples.push_back(-(i % 1000) + 2);
  }
  SPEECHSEG_ASSERT(WriteWaveFile(filename, WaveData(8000, 2, samples)));
}

void UnitTestConvert() {
  std::string dir = MakeTempDir(), in = JoinPath(dir, "in.wav"),
      out = JoinPath(dir, "out.wav");
  WriteStereo(in);
  WaveFileBackend backend;
  MediaError error;
  SPEECHSEG_ASSERT(backend.Convert(in, out, AudioFormat(8000, 16, 1),
                                   &error));
  WaveData wave;
  SPEECHSEG_ASSERT(ReadWaveFile(out, &wave));
  SPEECHSEG_ASSERT(wave.NumChannels() == 1 && wave.SampFreq() == 8000);
  SPEECHSEG_ASSERT(wave.NumSamples() == 8000);
  for (int32 i = 0; i < 8000; i++)
    SPEECHSEG_ASSERT(wave.Samples()[i] == 1);  // (x + 2 - x) / 2

  // The source is untouched.
  SPEECHSEG_ASSERT(ReadWaveFile(in, &wave) && wave.NumChannels() == 2);

  // No resampling.
  SPEECHSEG_ASSERT(!backend.Convert(in, out, AudioFormat(16000, 16, 1),
                                    &error));
  SPEECHSEG_ASSERT(error.tool == "wave" &&
                   error.message.find("cannot resample") !=
                   std::string::npos);
  SPEECHSEG_ASSERT(!backend.Convert(JoinPath(dir, "missing.wav"), out,
                                    AudioFormat(8000, 16, 1), &error));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestExtract() {
  std::string dir = MakeTempDir(), in = JoinPath(dir, "in.wav");
  WriteStereo(in);
  WaveFileBackend backend;
  MediaError error;
  ExtractRange range(0.25, 0.5, JoinPath(dir, "seg_1.wav"));
  SPEECHSEG_ASSERT(backend.Extract(in, range, &error));
  WaveData wave;
  SPEECHSEG_ASSERT(ReadWaveFile(range.output, &wave));
  SPEECHSEG_ASSERT(wave.NumChannels() == 2 && wave.NumSamples() == 2000);
  // Bit-exact copy of samples 2000..3999.
  for (int32 i = 0; i < 2000; i++) {
    SPEECHSEG_ASSERT(wave.Samples()[2 * i] == (2000 + i) % 1000);
    SPEECHSEG_ASSERT(wave.Samples()[2 * i + 1] == -((2000 + i) % 1000) + 2);
  }

  // Clipped at the end of the file.
  range = ExtractRange(0.9, 1.5, JoinPath(dir, "seg_2.wav"));
  SPEECHSEG_ASSERT(backend.Extract(in, range, &error));
  SPEECHSEG_ASSERT(ReadWaveFile(range.output, &wave) &&
                   wave.NumSamples() == 800);

  // Starts after the end.
  range = ExtractRange(1.5, 2.0, JoinPath(dir, "seg_3.wav"));
  SPEECHSEG_ASSERT(!backend.Extract(in, range, &error));
  SPEECHSEG_ASSERT(!FileExists(range.output));

  // The default batch extraction is one Extract() per range.
  std::vector<ExtractRange> ranges;
  ranges.push_back(ExtractRange(0.0, 0.1, JoinPath(dir, "b_1.wav")));
  ranges.push_back(ExtractRange(0.2, 0.3, JoinPath(dir, "b_2.wav")));
  SPEECHSEG_ASSERT(!backend.SupportsBatchExtract());
  SPEECHSEG_ASSERT(backend.ExtractBatch(in, ranges, &error));
  SPEECHSEG_ASSERT(FileExists(ranges[0].output) &&
                   FileExists(ranges[1].output));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestConvert();
  UnitTestExtract();
  std::cout << "Test OK.\n";
  return 0;
}
