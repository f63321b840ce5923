// media/media-backend.h

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

#ifndef SPEECHSEG_MEDIA_MEDIA_BACKEND_H_
#define SPEECHSEG_MEDIA_MEDIA_BACKEND_H_

#include <string>
#include <vector>

#include "base/speechseg-common.h"
#include "util/subprocess.h"

namespace speechseg {

/// \addtogroup media_group
/// @{

/// Why a media operation failed.
struct MediaError {
  std::string tool;      // backend or program name, e.g. "ffmpeg".
  int32 exit_status;     // exit status of the tool, or -1.
  std::string message;   // the tool's stderr, or our own description.

  MediaError(): exit_status(-1) { }

  void Clear() { tool.clear(); exit_status = -1; message.clear(); }

  /// One-line description for log messages.
  std::string ToString() const;
};

/// Sample format of a converted working copy.
struct AudioFormat {
  int32 sample_rate;
  int32 bits_per_sample;
  int32 num_channels;

  AudioFormat(): sample_rate(16000), bits_per_sample(16), num_channels(1) { }
  AudioFormat(int32 rate, int32 bits, int32 channels):
      sample_rate(rate), bits_per_sample(bits), num_channels(channels) { }
};

/// A time range of a source file, and the file it is extracted to.
struct ExtractRange {
  double start_sec;
  double end_sec;
  std::string output;

  ExtractRange(): start_sec(0.0), end_sec(0.0) { }
  ExtractRange(double start, double end, const std::string &out):
      start_sec(start), end_sec(end), output(out) { }
};

/**
   MediaBackend is the interface to whatever decodes, converts and cuts audio
   files: an external program such as ffmpeg or sox, or code in this
   process.  Methods return false on failure and, if "error" is non-NULL,
   describe the failure there; they do not throw for failures of the media
   tool itself.  Implementations must be safe to call from several threads
   at once, with different output files.
 */
class MediaBackend {
 public:
  /// Short name for logging, e.g. "ffmpeg".
  virtual std::string Name() const = 0;

  /// Writes a PCM WAV copy of "input" in the given format to "output",
  /// overwriting it.  "input" is not modified.
  virtual bool Convert(const std::string &input, const std::string &output,
                       const AudioFormat &format, MediaError *error) = 0;

  /// Copies the time range [range.start_sec, range.end_sec] of "input" to
  /// range.output without re-encoding.
  virtual bool Extract(const std::string &input, const ExtractRange &range,
                       MediaError *error) = 0;

  /// True if ExtractBatch() does better than one Extract() per range.
  virtual bool SupportsBatchExtract() const { return false; }

  /// Extracts several ranges of one input.  A return of false means some or
  /// all of the outputs may be missing.  The default calls Extract() for
  /// each range and stops at the first failure.
  virtual bool ExtractBatch(const std::string &input,
                            const std::vector<ExtractRange> &ranges,
                            MediaError *error);

  virtual ~MediaBackend() { }
};

/// Runs an external media tool and fills "error" if it fails.  Shared by the
/// subprocess backends.
bool RunMediaTool(const std::string &tool_name,
                  const std::vector<std::string> &argv, MediaError *error);

/// @} end "addtogroup media_group"

}  // namespace speechseg

#endif  // SPEECHSEG_MEDIA_MEDIA_BACKEND_H_
