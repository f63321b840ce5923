// pipeline/batch-orchestrator-test.cc

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

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iterator>

#include "audio/wave-reader.h"
#include "media/wave-backend.h"
#include "pipeline/batch-orchestrator.h"
#include "util/file-utils.h"

namespace speechseg {

static void WriteSpeechFile(const std::string &filename) {
  SPEECHSEG_ASSERT(CreateDirectories(DirName(filename)));
  std::vector<int16> samples;
  for (int32 f = 0; f < 100; f++) {
    bool loud = (f < 50 || f >= 90);
    for (int32 i = 0; i < 480; i++)
      samples.push_back(loud ? ((i / 8) % 2 ? 8000 : -8000) : (i % 2));
  }
  SPEECHSEG_ASSERT(WriteWaveFile(filename, WaveData(16000, 1, samples)));
}

static std::string ReadFile(const std::string &filename) {
  std::ifstream is(filename.c_str());
  return std::string((std::istreambuf_iterator<char>(is)),
                     std::istreambuf_iterator<char>());
}

// Lays out:
//   in/x.wav  in/a/y.wav  in/a/b/z.WAV  in/a/junk.wav  in/notes.txt
static std::string MakeInput() {
  char tmpl[] = "/tmp/speechseg-batch-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl;
  WriteSpeechFile(JoinPath(dir, "in/x.wav"));
  WriteSpeechFile(JoinPath(dir, "in/a/y.wav"));
  WriteSpeechFile(JoinPath(dir, "in/a/b/z.WAV"));
  std::ofstream junk(JoinPath(dir, "in/a/junk.wav").c_str());
  junk << "not audio";
  std::ofstream notes(JoinPath(dir, "in/notes.txt").c_str());
  notes << "not audio either";
  return dir;
}

static PipelineOptions EnergyOptions() {
  PipelineOptions opts;
  opts.vad_opts.classifier_opts.vad_type = "energy";
  return opts;
}

void UnitTestBatchOptions() {
  BatchOptions opts;
  opts.Check();
  SPEECHSEG_ASSERT(opts.Policy() == kClearAfter);
  SPEECHSEG_ASSERT(opts.NumWorkers() >= 1);
  opts.max_workers = 3;
  SPEECHSEG_ASSERT(opts.NumWorkers() == 3);
  opts.clear_temp = "sometimes";
  bool threw = false;
  try {
    opts.Check();
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

void UnitTestPlanJobs() {
  std::string dir = MakeInput();
  WaveFileBackend backend;
  SegmentationPipeline pipeline(EnergyOptions(), &backend, NULL);
  BatchOptions opts;
  opts.temp_dir = JoinPath(dir, "temp");
  BatchOrchestrator orchestrator(opts, &pipeline);
  std::vector<ProcessingJob> jobs;
  std::string in = JoinPath(dir, "in"), out = JoinPath(dir, "out");
  SPEECHSEG_ASSERT(orchestrator.PlanJobs(in, out, &jobs));
  SPEECHSEG_ASSERT(jobs.size() == 4);
  // Sorted within each directory, directories visited in name order.
  SPEECHSEG_ASSERT(jobs[0].source == JoinPath(in, "a/b/z.WAV"));
  SPEECHSEG_ASSERT(jobs[0].output_dir == JoinPath(out, "a/b/z_segment"));
  SPEECHSEG_ASSERT(jobs[0].working_copy ==
                   JoinPath(opts.temp_dir, "a/b/z.wav"));
  SPEECHSEG_ASSERT(jobs[1].source == JoinPath(in, "a/junk.wav"));
  SPEECHSEG_ASSERT(jobs[2].source == JoinPath(in, "a/y.wav"));
  SPEECHSEG_ASSERT(jobs[3].source == JoinPath(in, "x.wav"));
  SPEECHSEG_ASSERT(jobs[3].output_dir == JoinPath(out, "x_segment"));

  // Outputs placed inside the input tree are not taken as input.
  SPEECHSEG_ASSERT(orchestrator.PlanJobs(in, JoinPath(in, "a/b"), &jobs));
  SPEECHSEG_ASSERT(jobs.size() == 3);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

// The input root is the current directory and the output and workspace are
// named relative to it, as in "segment-audio-dir . out".
void UnitTestPlanJobsInCurrentDir() {
  char tmpl[] = "/tmp/speechseg-batch-cwd-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl, old_cwd = AbsolutePath(".");
  SPEECHSEG_ASSERT(chdir(dir.c_str()) == 0);
  WriteSpeechFile("a/x.wav");
  WriteSpeechFile("out/a/x_segment/segment_1.wav");
  WriteSpeechFile("temp/a/x.wav");

  WaveFileBackend backend;
  SegmentationPipeline pipeline(EnergyOptions(), &backend, NULL);
  BatchOptions opts;
  opts.temp_dir = "temp";
  BatchOrchestrator orchestrator(opts, &pipeline);
  std::vector<ProcessingJob> jobs;
  SPEECHSEG_ASSERT(orchestrator.PlanJobs(".", "out", &jobs));
  SPEECHSEG_ASSERT(jobs.size() == 1);
  SPEECHSEG_ASSERT(jobs[0].source == "./a/x.wav");
  SPEECHSEG_ASSERT(jobs[0].output_dir == "out/a/x_segment");
  SPEECHSEG_ASSERT(jobs[0].working_copy == "temp/a/x.wav");

  // Other spellings of the same directories.
  SPEECHSEG_ASSERT(orchestrator.PlanJobs("./", "./out/", &jobs));
  SPEECHSEG_ASSERT(jobs.size() == 1);
  SPEECHSEG_ASSERT(orchestrator.PlanJobs(dir, "out", &jobs));
  SPEECHSEG_ASSERT(jobs.size() == 1);
  SPEECHSEG_ASSERT(jobs[0].output_dir == "out/a/x_segment");
  SPEECHSEG_ASSERT(orchestrator.PlanJobs(".", JoinPath(dir, "out"), &jobs));
  SPEECHSEG_ASSERT(jobs.size() == 1);

  // A directory whose name merely starts with "out" is still input.
  WriteSpeechFile("outtakes/y.wav");
  SPEECHSEG_ASSERT(orchestrator.PlanJobs(".", "out", &jobs));
  SPEECHSEG_ASSERT(jobs.size() == 2);
  SPEECHSEG_ASSERT(jobs[1].output_dir == "out/outtakes/y_segment");

  SPEECHSEG_ASSERT(chdir(old_cwd.c_str()) == 0);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestRunBatch() {
  std::string dir = MakeInput();
  std::string in = JoinPath(dir, "in"), out = JoinPath(dir, "out");
  WaveFileBackend backend;
  SegmentationPipeline pipeline(EnergyOptions(), &backend, NULL);
  BatchOptions opts;
  opts.max_workers = 2;
  opts.temp_dir = JoinPath(dir, "temp");
  BatchOrchestrator orchestrator(opts, &pipeline);

  BatchSummary summary = orchestrator.Run(in, out, NULL);
  SPEECHSEG_ASSERT(summary.NumTotal() == 4);
  SPEECHSEG_ASSERT(summary.num_succeeded == 3);
  SPEECHSEG_ASSERT(summary.num_failed == 1 && summary.num_cancelled == 0);
  SPEECHSEG_ASSERT(summary.results[1].status == kResampleFailed);
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "a/junk_segment")));

  std::string y_manifest = JoinPath(out, "a/y_segment/segment_all.csv");
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "a/b/z_segment/segment_2.wav")));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "x_segment/segment_all.csv")));
  std::vector<ManifestRow> rows;
  SPEECHSEG_ASSERT(ReadManifest(y_manifest, &rows) && rows.size() == 2);
  SPEECHSEG_ASSERT(IsDirectory(opts.temp_dir));
  SPEECHSEG_ASSERT(FileExists(JoinPath(opts.temp_dir, "a/y.wav")));

  // A second run gives the same manifests.
  std::string before = ReadFile(y_manifest);
  summary = orchestrator.Run(in, out, NULL);
  SPEECHSEG_ASSERT(summary.num_succeeded == 3);
  SPEECHSEG_ASSERT(ReadFile(y_manifest) == before);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestCancelledBatch() {
  std::string dir = MakeInput();
  std::string in = JoinPath(dir, "in"), out = JoinPath(dir, "out");
  WaveFileBackend backend;
  SegmentationPipeline pipeline(EnergyOptions(), &backend, NULL);
  BatchOptions opts;
  opts.max_workers = 1;
  opts.temp_dir = JoinPath(dir, "temp");
  BatchOrchestrator orchestrator(opts, &pipeline);
  CancellationToken token;
  token.Cancel();
  BatchSummary summary = orchestrator.Run(in, out, &token);
  SPEECHSEG_ASSERT(summary.NumTotal() == 4);
  SPEECHSEG_ASSERT(summary.num_cancelled == 4 && summary.num_succeeded == 0);
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "x_segment")));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestMissingInput() {
  WaveFileBackend backend;
  SegmentationPipeline pipeline(EnergyOptions(), &backend, NULL);
  BatchOrchestrator orchestrator(BatchOptions(), &pipeline);
  bool threw = false;
  try {
    orchestrator.Run("/nonexistent/speechseg-test/in", "/tmp/unused", NULL);
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestBatchOptions();
  UnitTestPlanJobs();
  UnitTestPlanJobsInCurrentDir();
  UnitTestRunBatch();
  UnitTestCancelledBatch();
  UnitTestMissingInput();
  std::cout << "Test OK.\n";
  return 0;
}
