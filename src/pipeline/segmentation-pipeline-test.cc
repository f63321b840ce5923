// pipeline/segmentation-pipeline-test.cc

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

#include <cmath>
#include <cstdlib>
#include <fstream>

#include "audio/wave-reader.h"
#include "media/wave-backend.h"
#include "pipeline/segmentation-pipeline.h"
#include "util/file-utils.h"

namespace speechseg {

// Writes 100 frames of 30 ms: loud for frames 0-49 and 90-99, near silence
// for 50-89.  With the energy classifier and the default options this gives
// the segments [0, 1.47] and [2.7, 3.0].
static void WriteSpeechFile(const std::string &filename, int32 rate,
                            int32 channels) {
  int32 frame_length = rate / 1000 * 30;
  std::vector<int16> samples;
  for (int32 f = 0; f < 100; f++) {
    bool loud = (f < 50 || f >= 90);
    for (int32 i = 0; i < frame_length; i++) {
      int16 s = loud ? ((i / 8) % 2 ? 8000 : -8000) : (i % 2);
      for (int32 c = 0; c < channels; c++)
        samples.push_back(s);
    }
  }
  SPEECHSEG_ASSERT(WriteWaveFile(filename, WaveData(rate, channels,
                                                    samples)));
}

static PipelineOptions EnergyOptions() {
  PipelineOptions opts;
  opts.vad_opts.classifier_opts.vad_type = "energy";
  return opts;
}

static ProcessingJob MakeJob(const std::string &dir,
                             const std::string &name) {
  ProcessingJob job;
  job.source = JoinPath(dir, name);
  job.working_copy = JoinPath(dir, "temp/" + FileStem(name) + ".wav");
  job.output_dir = JoinPath(dir, "out/" + FileStem(name) + "_segment");
  return job;
}

static bool Near(double a, double b) { return std::abs(a - b) < 1.0e-09; }

void UnitTestStatusNames() {
  SPEECHSEG_ASSERT(std::string(JobStatusName(kSucceeded)) == "succeeded");
  SPEECHSEG_ASSERT(std::string(JobStatusName(kPreconditionFailed)) ==
                   "precondition-failed");
  SPEECHSEG_ASSERT(std::string(JobStatusName(kCancelled)) == "cancelled");
  JobResult result;
  SPEECHSEG_ASSERT(result.status == kCancelled && !result.Succeeded());
}

void UnitTestFullJob() {
  char tmpl[] = "/tmp/speechseg-pipeline-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl;
  // A stereo source: the working copy is mono, the segments stay stereo.
  WriteSpeechFile(JoinPath(dir, "talk.wav"), 16000, 2);
  WaveFileBackend backend;
  SegmentationPipeline pipeline(EnergyOptions(), &backend, NULL);
  ProcessingJob job = MakeJob(dir, "talk.wav");

  JobResult result = pipeline.Run(job, NULL);
  SPEECHSEG_ASSERT(result.status == kSucceeded && result.reason.empty());
  SPEECHSEG_ASSERT(result.num_segments == 2);
  SPEECHSEG_ASSERT(result.num_failed_segments == 0);

  WaveData working;
  SPEECHSEG_ASSERT(ReadWaveFile(job.working_copy, &working));
  SPEECHSEG_ASSERT(working.NumChannels() == 1);

  WaveData segment;
  SPEECHSEG_ASSERT(ReadWaveFile(JoinPath(job.output_dir, "segment_1.wav"),
                                &segment));
  SPEECHSEG_ASSERT(segment.NumChannels() == 2);
  SPEECHSEG_ASSERT(segment.NumSamples() == 23520);  // 1.47 s
  std::vector<ManifestRow> rows;
  SPEECHSEG_ASSERT(ReadManifest(JoinPath(job.output_dir, "segment_all.csv"),
                                &rows));
  SPEECHSEG_ASSERT(rows.size() == 2);
  SPEECHSEG_ASSERT(Near(rows[0].end_sec, 1.47));
  SPEECHSEG_ASSERT(Near(rows[1].start_sec, 2.7) &&
                   Near(rows[1].duration_sec, 0.3));

  // The source is untouched.
  WaveData source;
  SPEECHSEG_ASSERT(ReadWaveFile(job.source, &source));
  SPEECHSEG_ASSERT(source.NumChannels() == 2 && source.NumSamples() == 48000);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestMerging() {
  char tmpl[] = "/tmp/speechseg-pipeline-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl;
  WriteSpeechFile(JoinPath(dir, "talk.wav"), 16000, 1);
  WaveFileBackend backend;
  PipelineOptions opts = EnergyOptions();
  opts.merge_opts.min_len = 2.0;
  SegmentationPipeline pipeline(opts, &backend, NULL);
  SegmentList segments;
  JobResult result;
  SPEECHSEG_ASSERT(pipeline.ComputeSegments(MakeJob(dir, "talk.wav"),
                                            &segments, &result));
  SPEECHSEG_ASSERT(segments.size() == 1);
  SPEECHSEG_ASSERT(Near(segments[0].start_sec, 0.0) &&
                   Near(segments[0].end_sec, 3.0));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestFailures() {
  char tmpl[] = "/tmp/speechseg-pipeline-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl;
  WriteSpeechFile(JoinPath(dir, "cd.wav"), 44100, 1);
  WriteSpeechFile(JoinPath(dir, "stereo.wav"), 16000, 2);
  {
    std::ofstream os(JoinPath(dir, "junk.wav").c_str());
    os << "this is not a wave file";
  }
  WaveFileBackend backend;

  // The in-process backend cannot resample 44.1 kHz audio.
  SegmentationPipeline pipeline(EnergyOptions(), &backend, NULL);
  JobResult result = pipeline.Run(MakeJob(dir, "cd.wav"), NULL);
  SPEECHSEG_ASSERT(result.status == kResampleFailed);
  SPEECHSEG_ASSERT(result.reason.find("cannot resample") != std::string::npos);
  SPEECHSEG_ASSERT(!FileExists(JoinPath(dir, "out/cd_segment")));

  result = pipeline.Run(MakeJob(dir, "junk.wav"), NULL);
  SPEECHSEG_ASSERT(result.status == kResampleFailed);

  // Without resampling the VAD reads the source, which must be eligible.
  PipelineOptions opts = EnergyOptions();
  opts.resample_opts.resample = false;
  SegmentationPipeline direct(opts, &backend, NULL);
  result = direct.Run(MakeJob(dir, "stereo.wav"), NULL);
  SPEECHSEG_ASSERT(result.status == kPreconditionFailed);
  SPEECHSEG_ASSERT(result.reason.find("channel") != std::string::npos);
  SPEECHSEG_ASSERT(!FileExists(JoinPath(dir, "out/stereo_segment")));
  result = direct.Run(MakeJob(dir, "cd.wav"), NULL);
  SPEECHSEG_ASSERT(result.status == kPreconditionFailed);
  result = direct.Run(MakeJob(dir, "junk.wav"), NULL);
  SPEECHSEG_ASSERT(result.status == kPreconditionFailed);
  SPEECHSEG_ASSERT(!FileExists(JoinPath(dir, "temp")));

  // Cancelled before starting.
  CancellationToken token;
  token.Cancel();
  result = pipeline.Run(MakeJob(dir, "stereo.wav"), &token);
  SPEECHSEG_ASSERT(result.status == kCancelled);
  SPEECHSEG_ASSERT(!FileExists(JoinPath(dir, "out/stereo_segment")));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestStatusNames();
  UnitTestFullJob();
  UnitTestMerging();
  UnitTestFailures();
  std::cout << "Test OK.\n";
  return 0;
}
