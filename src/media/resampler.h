// media/resampler.h

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

#ifndef SPEECHSEG_MEDIA_RESAMPLER_H_
#define SPEECHSEG_MEDIA_RESAMPLER_H_

#include <string>

#include "media/media-backend.h"
#include "util/options-itf.h"

namespace speechseg {

struct ResampleOptions {
  int32 sample_rate;
  int32 target_width;
  int32 channels;
  bool resample;

  ResampleOptions(): sample_rate(16000), target_width(16), channels(1),
                     resample(true) { }

  void Register(OptionsItf *opts) {
    opts->Register("sample-rate", &sample_rate, "Sample rate of the working "
                   "copy the VAD runs on (8000, 16000, 32000 or 48000)");
    opts->Register("target-width", &target_width, "Sample width of the "
                   "working copy, in bits (only 16 is supported)");
    opts->Register("channels", &channels, "Channel count of the working copy "
                   "(only 1 is supported)");
    opts->Register("resample", &resample, "If false, the VAD reads the "
                   "source files directly, and files that are not already "
                   "mono 16-bit PCM at a supported rate are skipped");
  }

  void Check() const;

  AudioFormat Format() const {
    return AudioFormat(sample_rate, target_width, channels);
  }
};

/**
   Produces the working copy of a source file that the VAD reads.  The
   primary backend is tried first; if it fails, the fallback (if any) is
   tried.  The source file is never modified.  If both fail, any partial
   output is removed.
 */
class Resampler {
 public:
  /// The backends are not owned; "fallback" may be NULL.
  Resampler(const ResampleOptions &opts, MediaBackend *primary,
            MediaBackend *fallback);

  /// Converts "source" into "dest".  Returns false, with the last backend's
  /// error in "error" if it is non-NULL, when no backend succeeded.
  bool Resample(const std::string &source, const std::string &dest,
                MediaError *error) const;

 private:
  AudioFormat format_;
  MediaBackend *primary_;
  MediaBackend *fallback_;
};

}  // namespace speechseg

#endif  // SPEECHSEG_MEDIA_RESAMPLER_H_
