// audio/wave-reader-test.cc

// Copyright 2017  Smart Action LLC (kkm)
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

#include <cmath>
#include <iostream>
#include <sstream>

#include "audio/wave-reader.h"
#include "base/speechseg-common.h"

using namespace speechseg;

// Ugly macros to package bytes in wave file order (low-endian).
#define BY(n,k) ((char)((uint32)(n) >> (8 * (k)) & 0xFF))
#define WRD(n) BY(n,0), BY(n,1)
#define DWRD(n) BY(n,0), BY(n,1), BY(n,2), BY(n,3)

static void UnitTestStereo8K() {
  const int hz = 8000;
  const int byps = hz * 2 /* channels */ * 2 /* bytes/sample */;
  const char file_data[] = {
    'R', 'I', 'F', 'F',
    DWRD(50),   // File length after this point.
    'W', 'A', 'V', 'E',
    'f', 'm', 't', ' ',
    DWRD(18),   // sizeof(struct WAVEFORMATEX)
    WRD(1),     // WORD  wFormatTag;
    WRD(2),     // WORD  nChannels;
    DWRD(hz),   // DWORD nSamplesPerSec; 40 1f 00 00
    DWRD(byps), // DWORD nAvgBytesPerSec; 00 7d 00 00
    WRD(4),     // WORD  nBlockAlign;
    WRD(16),    // WORD  wBitsPerSample;
    WRD(0),     // WORD  cbSize;
    'd', 'a', 't', 'a',
    DWRD(12),   // 'data' chunk length.
    WRD(0), WRD(-1),
    WRD(-32768), WRD(0),
    WRD(32767), WRD(1)
  };

  const int16 expected[] = { 0, -1, -32768, 0, 32767, 1 };

  std::istringstream iws(std::string(file_data, sizeof file_data),
                         std::ios::in | std::ios::binary);
  WaveData wave;
  wave.Read(iws);

  SPEECHSEG_ASSERT(wave.SampFreq() == hz);
  SPEECHSEG_ASSERT(wave.NumChannels() == 2);
  SPEECHSEG_ASSERT(wave.NumSamples() == 3);
  SPEECHSEG_ASSERT(std::fabs(wave.Duration() - 3.0 / hz) < 1.0e-06);
  SPEECHSEG_ASSERT(wave.Samples().size() == 6);
  for (size_t i = 0; i < 6; i++)
    SPEECHSEG_ASSERT(wave.Samples()[i] == expected[i]);

  // Stereo is described, but is not something the classifier accepts.
  std::istringstream iws2(std::string(file_data, sizeof file_data),
                          std::ios::in | std::ios::binary);
  WaveInfo info;
  info.Read(iws2);
  std::string why;
  SPEECHSEG_ASSERT(!IsVadEligible(info.Descriptor(), &why));
  SPEECHSEG_ASSERT(why.find("channel") != std::string::npos);
}

static void UnitTestMono16K() {
  const int hz = 16000;
  const int byps = hz * 1 /* channels */ * 2 /* bytes/sample */;
  const char file_data[] = {
    'R', 'I', 'F', 'F',
    DWRD(48),   // File length after this point.
    'W', 'A', 'V', 'E',
    'f', 'm', 't', ' ',
    DWRD(18),   // sizeof(struct WAVEFORMATEX)
    WRD(1),     // WORD  wFormatTag;
    WRD(1),     // WORD  nChannels;
    DWRD(hz),   // DWORD nSamplesPerSec;
    DWRD(byps), // DWORD nAvgBytesPerSec;
    WRD(2),     // WORD  nBlockAlign;
    WRD(16),    // WORD  wBitsPerSample;
    WRD(0),     // WORD  cbSize;
    'd', 'a', 't', 'a',
    DWRD(10),   // 'data' chunk length.
    WRD(0), WRD(-1), WRD(-32768), WRD(32767), WRD(1)
  };

  const int16 expected[] = { 0, -1, -32768, 32767, 1 };

  std::istringstream iws(std::string(file_data, sizeof file_data),
                         std::ios::in | std::ios::binary);
  WaveInfo info;
  info.Read(iws);
  AudioStreamDescriptor desc = info.Descriptor();
  SPEECHSEG_ASSERT(desc.num_channels == 1);
  SPEECHSEG_ASSERT(desc.bits_per_sample == 16);
  SPEECHSEG_ASSERT(desc.sample_rate == hz);
  SPEECHSEG_ASSERT(desc.sample_count == 5);
  SPEECHSEG_ASSERT(IsVadEligible(desc, NULL));

  std::istringstream iws2(std::string(file_data, sizeof file_data),
                          std::ios::in | std::ios::binary);
  WaveData wave;
  wave.Read(iws2);
  SPEECHSEG_ASSERT(wave.NumSamples() == 5);
  for (size_t i = 0; i < 5; i++)
    SPEECHSEG_ASSERT(wave.Samples()[i] == expected[i]);
}

static void UnitTestEndless() {
  const int hz = 8000;
  const int byps = hz * 1 /* channels */ * 2 /* bytes/sample */;
  const char file_data[] = {
    'R', 'I', 'F', 'F',
    DWRD(-1),   // File length unknown
    'W', 'A', 'V', 'E',
    'f', 'm', 't', ' ',
    DWRD(18),   // sizeof(struct WAVEFORMATEX)
    WRD(1),     // WORD  wFormatTag;
    WRD(1),     // WORD  nChannels;
    DWRD(hz),   // DWORD nSamplesPerSec;
    DWRD(byps), // DWORD nAvgBytesPerSec;
    WRD(2),     // WORD  nBlockAlign;
    WRD(16),    // WORD  wBitsPerSample;
    WRD(0),     // WORD  cbSize;
    'd', 'a', 't', 'a',
    DWRD(-1),   // 'data' chunk length unknown.
    WRD(1), WRD(2), WRD(3)
  };

  std::istringstream iws(std::string(file_data, sizeof file_data),
                         std::ios::in | std::ios::binary);
  WaveData wave;
  wave.Read(iws);
  SPEECHSEG_ASSERT(wave.NumSamples() == 3);
  SPEECHSEG_ASSERT(wave.Samples()[0] == 1 && wave.Samples()[2] == 3);
}

static void UnitTestEightBitIsDescribed() {
  const int hz = 16000;
  const char file_data[] = {
    'R', 'I', 'F', 'F',
    DWRD(40),
    'W', 'A', 'V', 'E',
    'f', 'm', 't', ' ',
    DWRD(16),
    WRD(1),     // PCM
    WRD(1),     // mono
    DWRD(hz),
    DWRD(hz),   // one byte per sample
    WRD(1),
    WRD(8),
    'd', 'a', 't', 'a',
    DWRD(4),
    'a', 'b', 'c', 'd'
  };

  std::istringstream iws(std::string(file_data, sizeof file_data),
                         std::ios::in | std::ios::binary);
  WaveInfo info;
  info.Read(iws);
  std::string why;
  SPEECHSEG_ASSERT(info.BitsPerSample() == 8);
  SPEECHSEG_ASSERT(!IsVadEligible(info.Descriptor(), &why));
  SPEECHSEG_ASSERT(why.find("16-bit") != std::string::npos);

  // The sample data itself cannot be loaded.
  std::istringstream iws2(std::string(file_data, sizeof file_data),
                          std::ios::in | std::ios::binary);
  WaveData wave;
  bool threw = false;
  try {
    wave.Read(iws2);
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

static void UnitTestUnsupportedRate() {
  AudioStreamDescriptor desc;
  desc.num_channels = 1;
  desc.bits_per_sample = 16;
  desc.sample_rate = 44100;
  std::string why;
  SPEECHSEG_ASSERT(!IsVadEligible(desc, &why));
  SPEECHSEG_ASSERT(why.find("44100") != std::string::npos);
  int32 rates[] = { 8000, 16000, 32000, 48000 };
  for (int32 i = 0; i < 4; i++) {
    desc.sample_rate = rates[i];
    SPEECHSEG_ASSERT(IsVadEligible(desc, NULL));
  }
}

static void UnitTestNotAWave() {
  std::istringstream iws(std::string("ID3\x03 this is an mp3 file"),
                         std::ios::in | std::ios::binary);
  WaveInfo info;
  bool threw = false;
  try {
    info.Read(iws);
  } catch (const SpeechsegFatalError &e) {
    threw = true;
    SPEECHSEG_ASSERT(std::string(e.SpeechsegMessage()).find("RIFF") !=
                     std::string::npos);
  }
  SPEECHSEG_ASSERT(threw);
}

static void UnitTestWriteRead() {
  std::vector<int16> samples;
  for (int32 i = 0; i < 160; i++)
    samples.push_back(static_cast<int16>((i * 397) % 20000 - 10000));
  WaveData wave(16000, 1, samples);
  std::ostringstream os(std::ios::out | std::ios::binary);
  wave.Write(os);
  // 44-byte canonical header plus the samples.
  SPEECHSEG_ASSERT(os.str().size() == 44 + 2 * samples.size());

  std::istringstream is(os.str(), std::ios::in | std::ios::binary);
  WaveData wave2;
  wave2.Read(is);
  SPEECHSEG_ASSERT(wave2.SampFreq() == 16000);
  SPEECHSEG_ASSERT(wave2.Samples() == samples);
}

static void UnitTest() {
  UnitTestStereo8K();
  UnitTestMono16K();
  UnitTestEndless();
  UnitTestEightBitIsDescribed();
  UnitTestUnsupportedRate();
  UnitTestNotAWave();
  UnitTestWriteRead();
}

int main() {
  try {
    UnitTest();
    std::cout << "LGTM\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << e.what();
    return 1;
  }
}
