// media/segment-cutter.h

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

#ifndef SPEECHSEG_MEDIA_SEGMENT_CUTTER_H_
#define SPEECHSEG_MEDIA_SEGMENT_CUTTER_H_

#include <string>
#include <vector>

#include "media/manifest.h"
#include "media/media-backend.h"
#include "util/options-itf.h"
#include "util/worker-pool.h"
#include "vad/speech-segment.h"

namespace speechseg {

struct CutterOptions {
  std::string segment_name;
  bool segment_subfolders;
  std::string file_format;
  int32 batch_size;

  CutterOptions(): segment_name("segment"), segment_subfolders(false),
                   file_format("wav"), batch_size(10) { }

  void Register(OptionsItf *opts) {
    opts->Register("segment-name", &segment_name, "Segment files are named "
                   "{segment-name}_{n}.{file-format}, and the manifest "
                   "{segment-name}_all.csv");
    opts->Register("segment-subfolders", &segment_subfolders, "If true, put "
                   "each segment in its own folder segment_{n}");
    opts->Register("file-format", &file_format, "Extension of the source "
                   "files to process, and of the segment files");
    opts->Register("batch-size", &batch_size, "Number of segments cut by one "
                   "call of the media tool, where it can do several");
  }

  void Check() const;
};

/// What a call to SegmentCutter::Cut() did.
struct CutStats {
  int32 num_requested;
  int32 num_written;
  int32 num_failed;
  int32 num_batch_failures;  // batch calls that fell back to single cuts.

  CutStats(): num_requested(0), num_written(0), num_failed(0),
              num_batch_failures(0) { }
};

/**
   Cuts segments out of an original source file and writes their manifest.

   Each segment i (0-based) becomes {segment_name}_{i+1}.{file_format}, in
   the destination directory or, in subfolder mode, in its own folder
   segment_{i+1} below it.  Segments are extracted in batches of
   batch_size when the backend can do that; if a batch fails, each of its
   segments is tried on its own.  A segment that still cannot be cut is
   logged and left out: it has no file and no manifest row.  The manifest,
   {segment_name}_all.csv in the destination directory, always has a
   header, even when there are no segments.
 */
class SegmentCutter {
 public:
  /// The backend is not owned.
  SegmentCutter(const CutterOptions &opts, MediaBackend *backend);

  /// Returns false if the destination or the manifest could not be written,
  /// or if "cancel" (which may be NULL) was set before the manifest was
  /// written; in the last case there is no manifest afterwards, not even
  /// one from an earlier run.  Failures of single segments do not make it
  /// return false.
  bool Cut(const std::string &source, const std::string &dest_dir,
           const SegmentList &segments, const CancellationToken *cancel,
           CutStats *stats) const;

  /// The file segment "index" (0-based) is written to.
  std::string SegmentFolder(const std::string &dest_dir, size_t index) const;
  std::string SegmentFile(const std::string &dest_dir, size_t index) const;

 private:
  // Removes the manifest, numbered segment files and segment_{n} folders
  // of an earlier run from dest_dir.
  bool RemoveStaleOutputs(const std::string &dest_dir) const;

  // Extracts one range; removes any partial output on failure.
  bool CutOne(const std::string &source, const ExtractRange &range) const;

  // Cuts ranges [begin, end) of "ranges" and sets written[i] for the ones
  // that now exist.
  void CutBatch(const std::string &source,
                const std::vector<ExtractRange> &ranges, size_t begin,
                size_t end, std::vector<bool> *written,
                CutStats *stats) const;

  CutterOptions opts_;
  MediaBackend *backend_;
};

}  // namespace speechseg

#endif  // SPEECHSEG_MEDIA_SEGMENT_CUTTER_H_
