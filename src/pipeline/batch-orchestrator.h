// pipeline/batch-orchestrator.h

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

#ifndef SPEECHSEG_PIPELINE_BATCH_ORCHESTRATOR_H_
#define SPEECHSEG_PIPELINE_BATCH_ORCHESTRATOR_H_

#include <string>
#include <vector>

#include "pipeline/segmentation-pipeline.h"
#include "pipeline/workspace.h"
#include "util/options-itf.h"
#include "util/worker-pool.h"

namespace speechseg {

struct BatchOptions {
  int32 max_workers;
  std::string temp_dir;
  std::string clear_temp;

  BatchOptions(): max_workers(0), temp_dir("temp"), clear_temp("after") { }

  void Register(OptionsItf *opts) {
    opts->Register("max-workers", &max_workers, "Number of files processed "
                   "at the same time (0 means one per CPU)");
    opts->Register("temp-dir", &temp_dir, "Directory for the working copies "
                   "the VAD reads");
    opts->Register("clear-temp", &clear_temp, "When to empty --temp-dir: "
                   "before, after, both or none");
  }

  void Check() const;

  /// max_workers, or the number of CPUs if it is 0.
  int32 NumWorkers() const;

  ClearPolicy Policy() const;
};

/// Outcome of a batch.  results[i] belongs to jobs[i]; jobs that were never
/// started have status kCancelled.
struct BatchSummary {
  std::vector<ProcessingJob> jobs;
  std::vector<JobResult> results;
  int32 num_succeeded;
  int32 num_failed;
  int32 num_cancelled;
  double elapsed;

  BatchSummary(): num_succeeded(0), num_failed(0), num_cancelled(0),
                  elapsed(0.0) { }

  int32 NumTotal() const { return jobs.size(); }
};

/**
   Processes every source file below an input directory, several at a time.

   Each file root/a/b/x.{ext} becomes one ProcessingJob with output
   directory output/a/b/x_{segment_name} and working copy temp/a/b/x.wav.
   Jobs are independent: a job that fails, or throws, is logged with its
   file name and has no effect on the others.  If the cancellation token is
   set, no further jobs are started, queued jobs are dropped, and jobs that
   are already running stop at their next check.

   The workspace is created but never cleared here; see Workspace::Clear().
 */
class BatchOrchestrator {
 public:
  /// The pipeline is not owned and must outlive this object.
  BatchOrchestrator(const BatchOptions &opts,
                    const SegmentationPipeline *pipeline);

  /// Lists the source files below "input_root" and plans their jobs, in a
  /// stable order.  Files below "output_root" or the workspace are skipped,
  /// so that segments of an earlier run are never taken as input.  Returns
  /// false if the input directory could not be listed completely.
  bool PlanJobs(const std::string &input_root,
                const std::string &output_root,
                std::vector<ProcessingJob> *jobs) const;

  /// Plans and runs all jobs.  Dies with SPEECHSEG_ERR if the input cannot
  /// be listed or the output directory or workspace cannot be created;
  /// nothing else is fatal to the batch.  "cancel" may be NULL.
  BatchSummary Run(const std::string &input_root,
                   const std::string &output_root,
                   const CancellationToken *cancel) const;

  /// Runs the given jobs on the worker pool.
  BatchSummary RunJobs(const std::vector<ProcessingJob> &jobs,
                       const CancellationToken *cancel) const;

 private:
  // Runs one job; never throws.
  JobResult RunJob(const ProcessingJob &job,
                   const CancellationToken *cancel) const;

  BatchOptions opts_;
  const SegmentationPipeline *pipeline_;
  Workspace workspace_;
};

}  // namespace speechseg

#endif  // SPEECHSEG_PIPELINE_BATCH_ORCHESTRATOR_H_
