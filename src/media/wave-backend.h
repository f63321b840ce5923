// media/wave-backend.h

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

#ifndef SPEECHSEG_MEDIA_WAVE_BACKEND_H_
#define SPEECHSEG_MEDIA_WAVE_BACKEND_H_

#include <string>

#include "media/media-backend.h"

namespace speechseg {

/**
   A backend that works on 16-bit PCM WAV files in this process, with no
   external program.  It cannot change the sample rate: Convert() only
   reduces the channel count (by averaging the channels) and fails if the
   target rate differs from the source rate.  Extract() copies whole samples,
   so segments are bit-exact.  Sample positions are rounded from seconds to
   the nearest sample, and ranges are clipped to the end of the file; a range
   that starts at or after the end of the file fails.
 */
class WaveFileBackend: public MediaBackend {
 public:
  WaveFileBackend() { }

  virtual std::string Name() const { return "wave"; }

  virtual bool Convert(const std::string &input, const std::string &output,
                       const AudioFormat &format, MediaError *error);

  virtual bool Extract(const std::string &input, const ExtractRange &range,
                       MediaError *error);
};

}  // namespace speechseg

#endif  // SPEECHSEG_MEDIA_WAVE_BACKEND_H_
