// pipeline/batch-orchestrator.cc

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

#include "pipeline/batch-orchestrator.h"

#include <algorithm>
#include <atomic>

#include "base/timer.h"
#include "util/file-utils.h"

namespace speechseg {

void BatchOptions::Check() const {
  if (max_workers < 0)
    SPEECHSEG_ERR << "Invalid --max-workers=" << max_workers;
  if (temp_dir.empty())
    SPEECHSEG_ERR << "--temp-dir must not be empty";
  ClearPolicy policy;
  if (!ParseClearPolicy(clear_temp, &policy))
    SPEECHSEG_ERR << "Invalid --clear-temp=" << clear_temp
                  << ", expected before, after, both or none";
}

int32 BatchOptions::NumWorkers() const {
  return max_workers > 0 ? max_workers : DefaultNumThreads();
}

ClearPolicy BatchOptions::Policy() const {
  ClearPolicy policy = kClearAfter;
  if (!ParseClearPolicy(clear_temp, &policy))
    SPEECHSEG_ERR << "Invalid --clear-temp=" << clear_temp;
  return policy;
}

BatchOrchestrator::BatchOrchestrator(const BatchOptions &opts,
                                     const SegmentationPipeline *pipeline):
    opts_(opts), pipeline_(pipeline), workspace_(opts.temp_dir) {
  opts_.Check();
  SPEECHSEG_ASSERT(pipeline_ != NULL);
}

// True if "path" is "dir" or lies below it.  Both must be absolute and
// normalized.
static bool IsUnder(const std::string &dir, const std::string &path) {
  return path == dir || RelativePath(dir, path) != path;
}

bool BatchOrchestrator::PlanJobs(const std::string &input_root,
                                 const std::string &output_root,
                                 std::vector<ProcessingJob> *jobs) const {
  jobs->clear();
  const CutterOptions &cutter_opts = pipeline_->Options().cutter_opts;
  std::vector<std::string> files;
  bool ok = FindFilesRecursive(input_root, cutter_opts.file_format, &files);
  // "in/x.wav", "./in/x.wav" and "/abs/in/x.wav" may all name the same file,
  // so the roots are compared in absolute form.
  std::string abs_input = AbsolutePath(input_root),
      abs_output = AbsolutePath(output_root),
      abs_workspace = AbsolutePath(workspace_.Root());
  for (size_t i = 0; i < files.size(); i++) {
    std::string abs_file = AbsolutePath(files[i]);
    if (IsUnder(abs_output, abs_file) || IsUnder(abs_workspace, abs_file)) {
      SPEECHSEG_VLOG(2) << "Skipping " << files[i] << " (an output of ours)";
      continue;
    }
    std::string relative = RelativePath(abs_input, abs_file),
        rel_dir = DirName(relative);
    ProcessingJob job;
    job.source = files[i];
    job.working_copy = workspace_.WorkingCopyPath(relative);
    std::string out_dir = (rel_dir == "." ? output_root :
                           JoinPath(output_root, rel_dir));
    job.output_dir = JoinPath(out_dir, FileStem(relative) + "_" +
                              cutter_opts.segment_name);
    jobs->push_back(job);
  }
  return ok;
}

JobResult BatchOrchestrator::RunJob(const ProcessingJob &job,
                                    const CancellationToken *cancel) const {
  JobResult result;
  try {
    result = pipeline_->Run(job, cancel);
  } catch (const SpeechsegFatalError &e) {
    result.status = kFailed;
    result.reason = e.SpeechsegMessage();
  } catch (const std::exception &e) {
    result.status = kFailed;
    result.reason = e.what();
  }
  return result;
}

BatchSummary BatchOrchestrator::RunJobs(const std::vector<ProcessingJob> &jobs,
                                        const CancellationToken *cancel)
    const {
  Timer timer;
  BatchSummary summary;
  summary.jobs = jobs;
  summary.results.resize(jobs.size());
  int32 total = jobs.size();
  std::atomic<int32> num_done(0);

  {
    WorkerPool pool(std::min(opts_.NumWorkers(), std::max(total, 1)));
    SPEECHSEG_LOG << "Processing " << total << " files with "
                  << pool.NumThreads() << " workers";
    // Keep a few jobs queued so that a worker never waits for the
    // dispatcher.
    size_t max_outstanding = 2 * pool.NumThreads();
    for (int32 i = 0; i < total; i++) {
      pool.WaitForSlot(max_outstanding);
      if (cancel != NULL && cancel->IsCancelled()) break;
      pool.Submit([this, &summary, &num_done, cancel, total, i] {
          const ProcessingJob &job = summary.jobs[i];
          JobResult result = RunJob(job, cancel);
          summary.results[i] = result;
          int32 n = ++num_done;
          if (result.Succeeded()) {
            SPEECHSEG_LOG << "[" << n << "/" << total << "] Done: "
                          << job.source << " (" << result.num_segments
                          << " segments, " << result.elapsed << "s)";
          } else if (result.status == kCancelled) {
            SPEECHSEG_VLOG(1) << "[" << n << "/" << total << "] Cancelled: "
                              << job.source;
          } else {
            SPEECHSEG_WARN << "[" << n << "/" << total << "] Failed to "
                           << "process " << job.source << ": "
                           << JobStatusName(result.status) << ": "
                           << result.reason;
          }
        });
    }
    if (cancel != NULL && cancel->IsCancelled()) {
      size_t dropped = pool.CancelPending();
      SPEECHSEG_WARN << "Cancelled; dropped " << dropped << " queued files, "
                     << "waiting for running ones";
    }
    pool.Wait();
    pool.Shutdown();
  }

  for (size_t i = 0; i < summary.results.size(); i++) {
    if (summary.results[i].Succeeded()) summary.num_succeeded++;
    else if (summary.results[i].status == kCancelled) summary.num_cancelled++;
    else summary.num_failed++;
  }
  summary.elapsed = timer.Elapsed();
  SPEECHSEG_LOG << "Finished: " << summary.num_succeeded << "/" << total
                << " files processed successfully ("
                << summary.num_failed << " failed, " << summary.num_cancelled
                << " cancelled) in " << summary.elapsed << "s";
  return summary;
}

BatchSummary BatchOrchestrator::Run(const std::string &input_root,
                                    const std::string &output_root,
                                    const CancellationToken *cancel) const {
  if (!IsDirectory(input_root))
    SPEECHSEG_ERR << "Input directory " << input_root << " does not exist";
  if (!CreateDirectories(output_root))
    SPEECHSEG_ERR << "Could not create output directory " << output_root;
  if (!workspace_.Prepare())
    SPEECHSEG_ERR << "Could not create workspace " << workspace_.Root();
  SPEECHSEG_LOG << "Scanning " << input_root << " for ."
                << pipeline_->Options().cutter_opts.file_format << " files";
  std::vector<ProcessingJob> jobs;
  if (!PlanJobs(input_root, output_root, &jobs))
    SPEECHSEG_ERR << "Could not list all files under " << input_root;
  SPEECHSEG_LOG << "Found " << jobs.size() << " audio files to process";
  return RunJobs(jobs, cancel);
}

}  // namespace speechseg
