// media/media-toolchain.h

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

#ifndef SPEECHSEG_MEDIA_MEDIA_TOOLCHAIN_H_
#define SPEECHSEG_MEDIA_MEDIA_TOOLCHAIN_H_

#include <memory>
#include <string>

#include "media/media-backend.h"
#include "util/options-itf.h"

namespace speechseg {

struct MediaToolOptions {
  std::string media_backend;
  std::string ffmpeg_path;
  std::string sox_path;

  MediaToolOptions(): media_backend("external"), ffmpeg_path("ffmpeg"),
                      sox_path("sox") { }

  void Register(OptionsItf *opts) {
    opts->Register("media-backend", &media_backend, "How audio is converted "
                   "and cut: \"external\" (ffmpeg, with sox when ffmpeg "
                   "fails) or \"wave\" (16-bit PCM WAV only, no resampling, "
                   "no external programs)");
    opts->Register("ffmpeg-path", &ffmpeg_path, "ffmpeg program (name in "
                   "PATH, or full path)");
    opts->Register("sox-path", &sox_path, "sox program, used when ffmpeg "
                   "fails to convert a file");
  }

  void Check() const;
};

/// Owns the backends selected by MediaToolOptions.
class MediaToolchain {
 public:
  explicit MediaToolchain(const MediaToolOptions &opts);

  MediaBackend *Primary() const { return primary_.get(); }

  /// Used when the primary backend cannot convert a file; may be NULL.
  MediaBackend *Fallback() const { return fallback_.get(); }

 private:
  std::unique_ptr<MediaBackend> primary_;
  std::unique_ptr<MediaBackend> fallback_;
};

}  // namespace speechseg

#endif  // SPEECHSEG_MEDIA_MEDIA_TOOLCHAIN_H_
