// media/external-backends.h

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

#ifndef SPEECHSEG_MEDIA_EXTERNAL_BACKENDS_H_
#define SPEECHSEG_MEDIA_EXTERNAL_BACKENDS_H_

#include <string>
#include <vector>

#include "media/media-backend.h"

namespace speechseg {

/// Converts and cuts with the ffmpeg command-line program.  Cutting uses
/// "-acodec copy", so the segments keep the codec and quality of the source.
class FfmpegBackend: public MediaBackend {
 public:
  explicit FfmpegBackend(const std::string &binary): binary_(binary) { }

  virtual std::string Name() const { return "ffmpeg"; }

  virtual bool Convert(const std::string &input, const std::string &output,
                       const AudioFormat &format, MediaError *error);

  virtual bool Extract(const std::string &input, const ExtractRange &range,
                       MediaError *error);

  virtual bool SupportsBatchExtract() const { return true; }

  /// One ffmpeg run with one output per range.
  virtual bool ExtractBatch(const std::string &input,
                            const std::vector<ExtractRange> &ranges,
                            MediaError *error);

  // The argument lists, exposed for testing.
  std::vector<std::string> ConvertArgs(const std::string &input,
                                       const std::string &output,
                                       const AudioFormat &format) const;
  std::vector<std::string> ExtractArgs(const std::string &input,
                                       const ExtractRange &range) const;
  std::vector<std::string> ExtractBatchArgs(
      const std::string &input, const std::vector<ExtractRange> &ranges) const;

 private:
  std::string binary_;
};

/// Converts and cuts with sox.  Only the formats sox itself reads are
/// supported; cutting copies PCM samples, so WAV segments are bit-exact.
class SoxBackend: public MediaBackend {
 public:
  explicit SoxBackend(const std::string &binary): binary_(binary) { }

  virtual std::string Name() const { return "sox"; }

  virtual bool Convert(const std::string &input, const std::string &output,
                       const AudioFormat &format, MediaError *error);

  virtual bool Extract(const std::string &input, const ExtractRange &range,
                       MediaError *error);

  std::vector<std::string> ConvertArgs(const std::string &input,
                                       const std::string &output,
                                       const AudioFormat &format) const;
  std::vector<std::string> ExtractArgs(const std::string &input,
                                       const ExtractRange &range) const;

 private:
  std::string binary_;
};

}  // namespace speechseg

#endif  // SPEECHSEG_MEDIA_EXTERNAL_BACKENDS_H_
