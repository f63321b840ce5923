// media/media-toolchain.cc

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

#include "media/media-toolchain.h"

#include "media/external-backends.h"
#include "media/wave-backend.h"

namespace speechseg {

void MediaToolOptions::Check() const {
  if (media_backend != "external" && media_backend != "wave")
    SPEECHSEG_ERR << "Invalid --media-backend=" << media_backend
                  << ", expected external or wave";
  if (ffmpeg_path.empty() || sox_path.empty())
    SPEECHSEG_ERR << "--ffmpeg-path and --sox-path must not be empty";
}

MediaToolchain::MediaToolchain(const MediaToolOptions &opts) {
  opts.Check();
  if (opts.media_backend == "wave") {
    primary_.reset(new WaveFileBackend());
  } else {
    primary_.reset(new FfmpegBackend(opts.ffmpeg_path));
    fallback_.reset(new SoxBackend(opts.sox_path));
  }
  SPEECHSEG_VLOG(1) << "Media backend: " << primary_->Name()
                    << (fallback_ ? ", falling back to " +
                        fallback_->Name() : std::string());
}

}  // namespace speechseg
