// media/wave-backend.cc

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

#include "media/wave-backend.h"

#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

#include "audio/wave-reader.h"

namespace speechseg {

static bool SetError(const std::string &message, MediaError *error) {
  if (error != NULL) {
    error->tool = "wave";
    error->exit_status = -1;
    error->message = message;
  }
  return false;
}

// Like ReadWaveFile() but reports the problem through "error" rather than
// the log.
static bool ReadWave(const std::string &filename, WaveData *wave,
                     MediaError *error) {
  std::ifstream is(filename.c_str(), std::ios::binary);
  if (!is.good())
    return SetError("cannot open " + filename, error);
  try {
    wave->Read(is);
  } catch (const SpeechsegFatalError &e) {
    return SetError(filename + ": " + e.SpeechsegMessage(), error);
  }
  return true;
}

static bool WriteWave(const std::string &filename, const WaveData &wave,
                      MediaError *error) {
  std::ofstream os(filename.c_str(), std::ios::binary);
  if (!os.good())
    return SetError("cannot open " + filename + " for writing", error);
  try {
    wave.Write(os);
  } catch (const SpeechsegFatalError &e) {
    return SetError(filename + ": " + e.SpeechsegMessage(), error);
  }
  os.close();
  if (os.fail())
    return SetError("error closing " + filename, error);
  return true;
}

bool WaveFileBackend::Convert(const std::string &input,
                              const std::string &output,
                              const AudioFormat &format, MediaError *error) {
  WaveData wave;
  if (!ReadWave(input, &wave, error)) return false;
  if (format.bits_per_sample != 16)
    return SetError("only 16-bit output is supported", error);
  if (wave.SampFreq() != format.sample_rate) {
    std::ostringstream os;
    os << "cannot resample " << input << " from " << wave.SampFreq()
       << " to " << format.sample_rate << " Hz";
    return SetError(os.str(), error);
  }
  int32 in_channels = wave.NumChannels(), out_channels = format.num_channels;
  if (in_channels == out_channels)
    return WriteWave(output, wave, error);
  if (out_channels != 1) {
    std::ostringstream os;
    os << "cannot map " << in_channels << " channels to " << out_channels;
    return SetError(os.str(), error);
  }
  const std::vector<int16> &in = wave.Samples();
  int64 num_samples = wave.NumSamples();
  std::vector<int16> mono(num_samples);
  for (int64 i = 0; i < num_samples; i++) {
    int32 sum = 0;
    for (int32 c = 0; c < in_channels; c++)
      sum += in[i * in_channels + c];
    mono[i] = static_cast<int16>(sum / in_channels);
  }
  WaveData out(wave.SampFreq(), 1, mono);
  return WriteWave(output, out, error);
}

bool WaveFileBackend::Extract(const std::string &input,
                              const ExtractRange &range, MediaError *error) {
  WaveData wave;
  if (!ReadWave(input, &wave, error)) return false;
  int64 num_samples = wave.NumSamples();
  int64 begin = static_cast<int64>(std::floor(range.start_sec *
                                              wave.SampFreq() + 0.5)),
      end = static_cast<int64>(std::floor(range.end_sec *
                                          wave.SampFreq() + 0.5));
  if (end > num_samples) end = num_samples;
  if (begin < 0 || begin >= num_samples || end <= begin) {
    std::ostringstream os;
    os << "range " << range.start_sec << " to " << range.end_sec
       << " s is outside " << input << " (" << wave.Duration() << " s)";
    return SetError(os.str(), error);
  }
  int32 channels = wave.NumChannels();
  std::vector<int16> samples(wave.Samples().begin() + begin * channels,
                             wave.Samples().begin() + end * channels);
  WaveData out(wave.SampFreq(), channels, samples);
  return WriteWave(range.output, out, error);
}

}  // namespace speechseg
