// media/resampler.cc

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

#include "media/resampler.h"

#include "util/file-utils.h"

namespace speechseg {

void ResampleOptions::Check() const {
  if (sample_rate != 8000 && sample_rate != 16000 && sample_rate != 32000 &&
      sample_rate != 48000)
    SPEECHSEG_ERR << "Invalid --sample-rate=" << sample_rate
                  << ", expected 8000, 16000, 32000 or 48000";
  if (target_width != 16)
    SPEECHSEG_ERR << "Invalid --target-width=" << target_width
                  << ", only 16 is supported";
  if (channels != 1)
    SPEECHSEG_ERR << "Invalid --channels=" << channels
                  << ", the VAD needs mono input";
}

Resampler::Resampler(const ResampleOptions &opts, MediaBackend *primary,
                     MediaBackend *fallback):
    format_(opts.Format()), primary_(primary), fallback_(fallback) {
  SPEECHSEG_ASSERT(primary_ != NULL);
}

bool Resampler::Resample(const std::string &source, const std::string &dest,
                         MediaError *error) const {
  MediaError primary_error;
  if (primary_->Convert(source, dest, format_, &primary_error)) {
    SPEECHSEG_VLOG(1) << "Resampled " << source << " to "
                      << format_.sample_rate << " Hz -> " << dest;
    return true;
  }
  SPEECHSEG_WARN << "Resampling " << source << " with " << primary_->Name()
                 << " failed: " << primary_error.ToString();
  if (fallback_ != NULL) {
    MediaError fallback_error;
    if (fallback_->Convert(source, dest, format_, &fallback_error)) {
      SPEECHSEG_LOG << "Resampled " << source << " with "
                    << fallback_->Name() << " instead";
      return true;
    }
    SPEECHSEG_WARN << "Resampling " << source << " with "
                   << fallback_->Name() << " failed too: "
                   << fallback_error.ToString();
    primary_error = fallback_error;
  }
  if (!RemoveTree(dest))
    SPEECHSEG_WARN << "Could not remove partial output " << dest;
  if (error != NULL) *error = primary_error;
  return false;
}

}  // namespace speechseg
