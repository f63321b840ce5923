// audio/wave-reader.h

// Copyright 2009-2011  Karel Vesely;  Microsoft Corporation
//                2013  Florent Masson
//                2013  Johns Hopkins University (author: Daniel Povey)
//                2026  The speechseg Authors

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


/*
// THE WAVE FORMAT IS SPECIFIED IN:
// https:// ccrma.stanford.edu/courses/422/projects/WaveFormat/
//
//
//
//  RIFF
//  |
//  WAVE
//  |    \    \   \
//  fmt_ data ... data
//
//
//  Riff is a general container, which usually contains one WAVE chunk
//  each WAVE chunk has header sub-chunk 'fmt_'
//  and one or more data sub-chunks 'data'
//
//  [Note from Dan: to say that the wave format was ever "specified" anywhere is
//   not quite right.  The guy who invented the wave format attempted to create
//   a formal specification but it did not completely make sense.  And there
//   doesn't seem to be a consensus on what makes a valid wave file,
//   particularly where the accuracy of header information is concerned.]
*/


#ifndef SPEECHSEG_AUDIO_WAVE_READER_H_
#define SPEECHSEG_AUDIO_WAVE_READER_H_

#include <string>
#include <utility>
#include <vector>

#include "base/speechseg-common.h"

namespace speechseg {

/// Channel count, sample width, rate and length of a PCM stream.  This is all
/// the segmenter needs to know about a file before it looks at the samples.
struct AudioStreamDescriptor {
  int32 num_channels;
  int32 bits_per_sample;
  int32 sample_rate;
  int64 sample_count;  // per channel; -1 if the header does not say.

  AudioStreamDescriptor(): num_channels(0), bits_per_sample(0),
                           sample_rate(0), sample_count(0) { }

  /// Duration in seconds, or -1 if the length is unknown.
  double Duration() const {
    if (sample_count < 0 || sample_rate <= 0) return -1.0;
    return static_cast<double>(sample_count) / sample_rate;
  }
};

/// Returns true if frames of this stream can be given to a frame classifier:
/// mono, 16-bit, and a rate of 8000, 16000, 32000 or 48000 Hz.  If not, and
/// "why" is non-NULL, a description of the first violated requirement is put
/// there.
bool IsVadEligible(const AudioStreamDescriptor &desc, std::string *why);

/// This class reads and holds wave file header information.
class WaveInfo {
 public:
  WaveInfo() : samp_freq_(0), samp_count_(0), num_channels_(0),
               bits_per_sample_(0), reverse_bytes_(false) {}

  /// Is stream size unknown? Duration and SampleCount not valid if true.
  bool IsStreamed() const { return samp_count_ < 0; }

  /// Sample frequency, Hz.
  int32 SampFreq() const { return samp_freq_; }

  /// Number of samples in stream. Invalid if IsStreamed() is true.
  int64 SampleCount() const { return samp_count_; }

  /// Approximate duration, seconds. Invalid if IsStreamed() is true.
  double Duration() const {
    return static_cast<double>(samp_count_) / samp_freq_;
  }

  /// Number of channels, 1 to 16.
  int32 NumChannels() const { return num_channels_; }

  int32 BitsPerSample() const { return bits_per_sample_; }

  /// Bytes per sample frame (all channels).
  size_t BlockAlign() const { return num_channels_ * (bits_per_sample_ / 8); }

  /// Wave data bytes. Invalid if IsStreamed() is true.
  size_t DataBytes() const { return samp_count_ * BlockAlign(); }

  /// Is data file byte order different from machine byte order?
  bool ReverseBytes() const { return reverse_bytes_; }

  AudioStreamDescriptor Descriptor() const;

  /// 'is' should be opened in binary mode. Read() will throw on error.
  /// On success 'is' will be positioned at the beginning of wave data.
  /// Headers of PCM data with a width other than 16 bits are accepted here;
  /// it is WaveData and the VAD eligibility check that reject them.
  void Read(std::istream &is);

 private:
  int32 samp_freq_;
  int64 samp_count_;     // 0 if empty, -1 if undefined length.
  int32 num_channels_;
  int32 bits_per_sample_;
  bool reverse_bytes_;   // File endianness differs from host.
};

/// This class's purpose is to read in and write out 16-bit Wave files.
/// Samples are kept interleaved, as they are in the file.
class WaveData {
 public:
  WaveData(int32 samp_freq, int32 num_channels,
           const std::vector<int16> &samples)
      : samples_(samples), samp_freq_(samp_freq),
        num_channels_(num_channels) {}

  WaveData() : samp_freq_(0), num_channels_(0) {}

  /// Read() will throw on error.  It's valid to call Read() more than once--
  /// in this case it will destroy what was there before.
  /// "is" should be opened in binary mode.
  void Read(std::istream &is);

  /// Write() will throw on error.   os should be opened in binary mode.
  void Write(std::ostream &os) const;

  const std::vector<int16> &Samples() const { return samples_; }

  int32 SampFreq() const { return samp_freq_; }

  int32 NumChannels() const { return num_channels_; }

  /// Samples per channel.
  int64 NumSamples() const {
    return num_channels_ == 0 ? 0 : samples_.size() / num_channels_;
  }

  // Returns the duration in seconds
  double Duration() const {
    return samp_freq_ == 0 ? 0.0 :
        static_cast<double>(NumSamples()) / samp_freq_;
  }

  void Clear() {
    samples_.clear();
    samp_freq_ = 0;
    num_channels_ = 0;
  }

  void Swap(WaveData *other) {
    samples_.swap(other->samples_);
    std::swap(samp_freq_, other->samp_freq_);
    std::swap(num_channels_, other->num_channels_);
  }

 private:
  std::vector<int16> samples_;
  int32 samp_freq_;
  int32 num_channels_;
};

/// Reads only the header of a wave file.  Returns false and warns on failure
/// instead of throwing.
bool ReadWaveInfo(const std::string &filename, WaveInfo *info);

/// Reads a whole 16-bit wave file.  Returns false and warns on failure.
bool ReadWaveFile(const std::string &filename, WaveData *wave);

/// Writes a 16-bit wave file.  Returns false and warns on failure.
bool WriteWaveFile(const std::string &filename, const WaveData &wave);

}  // namespace speechseg

#endif  // SPEECHSEG_AUDIO_WAVE_READER_H_
