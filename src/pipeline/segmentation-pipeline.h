// pipeline/segmentation-pipeline.h

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

#ifndef SPEECHSEG_PIPELINE_SEGMENTATION_PIPELINE_H_
#define SPEECHSEG_PIPELINE_SEGMENTATION_PIPELINE_H_

#include <string>

#include "media/media-backend.h"
#include "media/resampler.h"
#include "media/segment-cutter.h"
#include "util/options-itf.h"
#include "util/worker-pool.h"
#include "vad/segment-merger.h"
#include "vad/speech-segmenter.h"

namespace speechseg {

/// All options that decide how one file is segmented and cut.
struct PipelineOptions {
  VadOptions vad_opts;
  MergeOptions merge_opts;
  ResampleOptions resample_opts;
  CutterOptions cutter_opts;

  void Register(OptionsItf *opts) {
    vad_opts.Register(opts);
    merge_opts.Register(opts);
    resample_opts.Register(opts);
    cutter_opts.Register(opts);
  }

  /// Dies with SPEECHSEG_ERR if any of the options is invalid.
  void Check() const {
    vad_opts.Check();
    merge_opts.Check();
    resample_opts.Check();
    cutter_opts.Check();
  }
};

enum JobStatus {
  kSucceeded,
  kPreconditionFailed,  // not mono 16-bit PCM at a supported rate.
  kResampleFailed,      // no backend could make the working copy.
  kIoFailed,            // output directory or manifest could not be written.
  kCancelled,
  kFailed               // anything else, e.g. an exception.
};

/// "succeeded", "precondition-failed", ...
const char *JobStatusName(JobStatus status);

/// One source file, and where its working copy and segments go.
struct ProcessingJob {
  std::string source;        // original file; only ever read.
  std::string working_copy;  // converted copy in the workspace.
  std::string output_dir;    // segments and manifest go here.
};

struct JobResult {
  JobStatus status;
  std::string reason;   // empty on success.
  int32 num_segments;   // segment files written.
  int32 num_failed_segments;
  double elapsed;       // seconds.

  JobResult(): status(kCancelled), num_segments(0), num_failed_segments(0),
               elapsed(0.0) { }

  bool Succeeded() const { return status == kSucceeded; }
};

/**
   Runs the steps for one source file: make the working copy, find speech
   segments in it, merge short ones, and cut the merged ranges out of the
   original file.  The object holds only configuration and the (unowned)
   backends, so one instance can serve many jobs on different threads at the
   same time.
 */
class SegmentationPipeline {
 public:
  /// "fallback" may be NULL.  Checks the options.
  SegmentationPipeline(const PipelineOptions &opts, MediaBackend *primary,
                       MediaBackend *fallback);

  /// Makes the working copy (unless resampling is off, in which case the
  /// source itself is read) and returns the merged speech segments.  On
  /// failure returns false and fills "result" with the status and reason.
  /// Errors from the frame classifier propagate as exceptions.
  bool ComputeSegments(const ProcessingJob &job, SegmentList *segments,
                       JobResult *result) const;

  /// Runs the whole job.  "cancel" may be NULL.  Returns kCancelled if the
  /// token is set before the job starts or before its manifest is written;
  /// a cancelled job never counts as succeeded.  May throw on errors that
  /// are not the file's fault; the caller is expected to catch.
  JobResult Run(const ProcessingJob &job,
                const CancellationToken *cancel) const;

  const PipelineOptions &Options() const { return opts_; }

 private:
  PipelineOptions opts_;
  Resampler resampler_;
  SegmentCutter cutter_;
};

}  // namespace speechseg

#endif  // SPEECHSEG_PIPELINE_SEGMENTATION_PIPELINE_H_
