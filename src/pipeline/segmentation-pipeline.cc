// pipeline/segmentation-pipeline.cc

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

#include "pipeline/segmentation-pipeline.h"

#include <memory>

#include "audio/wave-reader.h"
#include "base/timer.h"
#include "util/file-utils.h"
#include "vad/frame-classifier.h"

namespace speechseg {

const char *JobStatusName(JobStatus status) {
  switch (status) {
    case kSucceeded: return "succeeded";
    case kPreconditionFailed: return "precondition-failed";
    case kResampleFailed: return "resample-failed";
    case kIoFailed: return "io-failed";
    case kCancelled: return "cancelled";
    case kFailed: return "failed";
  }
  return "unknown";
}

static bool SetResult(JobStatus status, const std::string &reason,
                      JobResult *result) {
  result->status = status;
  result->reason = reason;
  return false;
}

SegmentationPipeline::SegmentationPipeline(const PipelineOptions &opts,
                                           MediaBackend *primary,
                                           MediaBackend *fallback):
    opts_(opts), resampler_(opts.resample_opts, primary, fallback),
    cutter_(opts.cutter_opts, primary) {
  opts_.Check();
}

bool SegmentationPipeline::ComputeSegments(const ProcessingJob &job,
                                           SegmentList *segments,
                                           JobResult *result) const {
  segments->clear();
  std::string vad_input = job.source;
  if (opts_.resample_opts.resample) {
    std::string dir = DirName(job.working_copy);
    if (!CreateDirectories(dir))
      return SetResult(kIoFailed, "cannot create workspace directory " + dir,
                       result);
    MediaError error;
    if (!resampler_.Resample(job.source, job.working_copy, &error))
      return SetResult(kResampleFailed, error.ToString(), result);
    vad_input = job.working_copy;
  }

  WaveInfo info;
  if (!ReadWaveInfo(vad_input, &info))
    return SetResult(kPreconditionFailed, "not a readable PCM wave file: " +
                     vad_input, result);
  std::string why;
  if (!IsVadEligible(info.Descriptor(), &why))
    return SetResult(kPreconditionFailed, why, result);
  WaveData wave;
  if (!ReadWaveFile(vad_input, &wave))
    return SetResult(kIoFailed, "cannot read samples of " + vad_input,
                     result);

  std::unique_ptr<FrameClassifier> classifier(
      NewFrameClassifier(opts_.vad_opts.classifier_opts, wave.SampFreq(),
                         opts_.vad_opts.frame_duration));
  SegmentList raw_segments;
  ComputeSpeechSegments(opts_.vad_opts, wave.Samples(), classifier.get(),
                        &raw_segments);
  MergeShortSegments(raw_segments, opts_.merge_opts.min_len, segments);
  SPEECHSEG_VLOG(1) << "Detected " << raw_segments.size() << " speech "
                    << "segments in " << job.source << ", "
                    << segments->size() << " after merging";
  return true;
}

JobResult SegmentationPipeline::Run(const ProcessingJob &job,
                                    const CancellationToken *cancel) const {
  Timer timer;
  JobResult result;
  if (cancel != NULL && cancel->IsCancelled()) {
    result.reason = "cancelled before starting";
    return result;
  }
  SegmentList segments;
  if (!ComputeSegments(job, &segments, &result)) {
    result.elapsed = timer.Elapsed();
    return result;
  }
  if (cancel != NULL && cancel->IsCancelled()) {
    result.status = kCancelled;
    result.reason = "cancelled before cutting";
    result.elapsed = timer.Elapsed();
    return result;
  }
  CutStats stats;
  bool ok = cutter_.Cut(job.source, job.output_dir, segments, cancel, &stats);
  result.num_segments = stats.num_written;
  result.num_failed_segments = stats.num_failed;
  result.elapsed = timer.Elapsed();
  if (!ok) {
    if (cancel != NULL && cancel->IsCancelled()) {
      result.status = kCancelled;
      result.reason = "cancelled while cutting";
    } else {
      result.status = kIoFailed;
      result.reason = "cannot write segments or manifest in " +
          job.output_dir;
    }
    return result;
  }
  result.status = kSucceeded;
  result.reason.clear();
  return result;
}

}  // namespace speechseg
