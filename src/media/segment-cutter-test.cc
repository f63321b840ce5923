// media/segment-cutter-test.cc

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

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

#include "audio/wave-reader.h"
#include "media/segment-cutter.h"
#include "media/wave-backend.h"
#include "util/file-utils.h"

namespace speechseg {

// Cuts with WaveFileBackend, but can pretend to support batches, fail
// batches, fail chosen outputs, and cancel a token when it reaches a chosen
// output, the way an interrupt kills the media tool mid-cut.
class ScriptedBackend: public WaveFileBackend {
 public:
  ScriptedBackend(): batch_(false), fail_batches_(false), cancel_(NULL),
                     num_batch_calls_(0), num_single_calls_(0) { }

  virtual bool Extract(const std::string &input, const ExtractRange &range,
                       MediaError *error) {
    num_single_calls_++;
    if (cancel_ != NULL && BaseName(range.output) == cancel_at_) {
      cancel_->Cancel();
      error->tool = "scripted";
      error->exit_status = 130;
      error->message = "interrupted";
      return false;
    }
    if (fail_outputs_.count(BaseName(range.output)) != 0) {
      // Leave a partial file, as a real tool might.
      std::ofstream os(range.output.c_str());
      os << "partial";
      error->tool = "scripted";
      error->exit_status = 1;
      error->message = "cannot cut " + range.output;
      return false;
    }
    return WaveFileBackend::Extract(input, range, error);
  }

  virtual bool SupportsBatchExtract() const { return batch_; }

  virtual bool ExtractBatch(const std::string &input,
                            const std::vector<ExtractRange> &ranges,
                            MediaError *error) {
    num_batch_calls_++;
    batch_sizes_.push_back(ranges.size());
    if (fail_batches_) {
      error->tool = "scripted";
      error->exit_status = 1;
      return false;
    }
    for (size_t i = 0; i < ranges.size(); i++) {
      if (fail_outputs_.count(BaseName(ranges[i].output)) != 0) continue;
      if (!WaveFileBackend::Extract(input, ranges[i], error)) return false;
    }
    return true;
  }

  bool batch_;
  bool fail_batches_;
  std::set<std::string> fail_outputs_;
  CancellationToken *cancel_;
  std::string cancel_at_;
  int32 num_batch_calls_;
  int32 num_single_calls_;
  std::vector<size_t> batch_sizes_;
};

static std::string MakeTempDir() {
  char tmpl[] = "/tmp/speechseg-cutter-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  return tmpl;
}

// 16 kHz mono, 5 seconds, sample i has value i % 30000.
static std::string WriteSource(const std::string &dir) {
  std::vector<int16> samples(5 * 16000);
  for (size_t i = 0; i < samples.size(); i++)
    samples[i] = i % 30000;
  std::string filename = JoinPath(dir, "source.wav");
  SPEECHSEG_ASSERT(WriteWaveFile(filename, WaveData(16000, 1, samples)));
  return filename;
}

static SegmentList FiveSegments() {
  SegmentList segments;
  for (int32 i = 0; i < 5; i++)
    segments.push_back(SpeechSegment(i * 1.0, i * 1.0 + 0.5));
  return segments;
}

static int32 NumLines(const std::string &filename) {
  std::ifstream is(filename.c_str());
  std::string line;
  int32 n = 0;
  while (std::getline(is, line)) n++;
  return n;
}

void UnitTestNaming() {
  CutterOptions opts;
  opts.segment_name = "seg";
  ScriptedBackend backend;
  SegmentCutter cutter(opts, &backend);
  SPEECHSEG_ASSERT(cutter.SegmentFolder("out", 0) == "out");
  SPEECHSEG_ASSERT(cutter.SegmentFile("out", 0) == "out/seg_1.wav");
  SPEECHSEG_ASSERT(cutter.SegmentFile("out", 11) == "out/seg_12.wav");
  opts.segment_subfolders = true;
  opts.file_format = "flac";
  SegmentCutter sub_cutter(opts, &backend);
  SPEECHSEG_ASSERT(sub_cutter.SegmentFolder("out", 2) == "out/segment_3");
  SPEECHSEG_ASSERT(sub_cutter.SegmentFile("out", 2) ==
                   "out/segment_3/seg_3.flac");

  opts.batch_size = 0;
  bool threw = false;
  try {
    SegmentCutter bad(opts, &backend);
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

void UnitTestCutFlat() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out/source_segment");
  CutterOptions opts;
  opts.batch_size = 2;
  ScriptedBackend backend;
  backend.batch_ = true;
  SegmentCutter cutter(opts, &backend);
  CutStats stats;
  SPEECHSEG_ASSERT(cutter.Cut(source, out, FiveSegments(), NULL, &stats));
  SPEECHSEG_ASSERT(stats.num_requested == 5 && stats.num_written == 5);
  SPEECHSEG_ASSERT(stats.num_failed == 0 && stats.num_batch_failures == 0);
  // Batches of 2, 2 and 1; the last is a single cut.
  SPEECHSEG_ASSERT(backend.num_batch_calls_ == 2);
  SPEECHSEG_ASSERT(backend.num_single_calls_ == 1);

  WaveData wave;
  SPEECHSEG_ASSERT(ReadWaveFile(JoinPath(out, "segment_3.wav"), &wave));
  SPEECHSEG_ASSERT(wave.NumSamples() == 8000);
  SPEECHSEG_ASSERT(wave.Samples()[0] == 32000 % 30000);

  std::vector<ManifestRow> rows;
  SPEECHSEG_ASSERT(ReadManifest(JoinPath(out, "segment_all.csv"), &rows));
  SPEECHSEG_ASSERT(rows.size() == 5);
  for (size_t i = 0; i < rows.size(); i++) {
    SPEECHSEG_ASSERT(rows[i].segment_folder == out);
    SPEECHSEG_ASSERT(rows[i].segment_file == cutter.SegmentFile(out, i));
    SPEECHSEG_ASSERT(rows[i].start_sec == i * 1.0);
    SPEECHSEG_ASSERT(rows[i].duration_sec == 0.5);
  }
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestBatchFallback() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  CutterOptions opts;
  opts.batch_size = 10;
  ScriptedBackend backend;
  backend.batch_ = true;
  backend.fail_batches_ = true;
  backend.fail_outputs_.insert("segment_2.wav");
  SegmentCutter cutter(opts, &backend);
  CutStats stats;
  SPEECHSEG_ASSERT(cutter.Cut(source, out, FiveSegments(), NULL, &stats));
  SPEECHSEG_ASSERT(stats.num_batch_failures == 1);
  SPEECHSEG_ASSERT(backend.num_single_calls_ == 5);
  SPEECHSEG_ASSERT(stats.num_written == 4 && stats.num_failed == 1);
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_2.wav")));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_5.wav")));

  // The manifest has a row per written file, still in order.
  std::vector<ManifestRow> rows;
  SPEECHSEG_ASSERT(ReadManifest(JoinPath(out, "segment_all.csv"), &rows));
  SPEECHSEG_ASSERT(rows.size() == 4);
  SPEECHSEG_ASSERT(rows[0].segment_file == JoinPath(out, "segment_1.wav"));
  SPEECHSEG_ASSERT(rows[1].segment_file == JoinPath(out, "segment_3.wav"));
  for (size_t i = 1; i < rows.size(); i++)
    SPEECHSEG_ASSERT(rows[i - 1].start_sec < rows[i].start_sec);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestMissingBatchOutput() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  CutterOptions opts;
  ScriptedBackend backend;
  backend.batch_ = true;
  // The batch "succeeds" but skips segment_4; the single retry fails too.
  backend.fail_outputs_.insert("segment_4.wav");
  SegmentCutter cutter(opts, &backend);
  CutStats stats;
  SPEECHSEG_ASSERT(cutter.Cut(source, out, FiveSegments(), NULL, &stats));
  SPEECHSEG_ASSERT(backend.num_batch_calls_ == 1);
  SPEECHSEG_ASSERT(backend.num_single_calls_ == 1);
  SPEECHSEG_ASSERT(stats.num_written == 4 && stats.num_failed == 1);
  SPEECHSEG_ASSERT(NumLines(JoinPath(out, "segment_all.csv")) == 5);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestSubfolders() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  CutterOptions opts;
  opts.segment_subfolders = true;
  ScriptedBackend backend;
  backend.fail_outputs_.insert("segment_5.wav");
  SegmentCutter cutter(opts, &backend);
  CutStats stats;
  SPEECHSEG_ASSERT(cutter.Cut(source, out, FiveSegments(), NULL, &stats));
  SPEECHSEG_ASSERT(stats.num_written == 4);
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_1/segment_1.wav")));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_4/segment_4.wav")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_5")));
  std::vector<ManifestRow> rows;
  SPEECHSEG_ASSERT(ReadManifest(JoinPath(out, "segment_all.csv"), &rows));
  SPEECHSEG_ASSERT(rows.size() == 4);
  SPEECHSEG_ASSERT(rows[3].segment_folder == JoinPath(out, "segment_4"));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestNoSegments() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  CutterOptions opts;
  ScriptedBackend backend;
  SegmentCutter cutter(opts, &backend);
  SPEECHSEG_ASSERT(cutter.Cut(source, out, SegmentList(), NULL, NULL));
  SPEECHSEG_ASSERT(NumLines(JoinPath(out, "segment_all.csv")) == 1);
  SPEECHSEG_ASSERT(backend.num_single_calls_ == 0);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestCancelled() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  CutterOptions opts;
  ScriptedBackend backend;
  SegmentCutter cutter(opts, &backend);
  CancellationToken token;
  token.Cancel();
  SPEECHSEG_ASSERT(!cutter.Cut(source, out, FiveSegments(), &token, NULL));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_all.csv")));
  SPEECHSEG_ASSERT(backend.num_single_calls_ == 0);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestCancelledInLastBatch() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  CutterOptions opts;
  opts.batch_size = 2;
  ScriptedBackend backend;
  CancellationToken token;
  backend.cancel_ = &token;
  backend.cancel_at_ = "segment_5.wav";
  SegmentCutter cutter(opts, &backend);
  CutStats stats;
  SPEECHSEG_ASSERT(!cutter.Cut(source, out, FiveSegments(), &token, &stats));
  SPEECHSEG_ASSERT(token.IsCancelled());
  SPEECHSEG_ASSERT(backend.num_single_calls_ == 5);
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_4.wav")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_5.wav")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_all.csv")));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

// A rerun that is interrupted must not leave the earlier run's manifest
// pointing at files the rerun already removed.
void UnitTestCancelledRerun() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  std::string manifest = JoinPath(out, "segment_all.csv");
  CutterOptions opts;
  opts.batch_size = 2;
  ScriptedBackend backend;
  SegmentCutter cutter(opts, &backend);
  SPEECHSEG_ASSERT(cutter.Cut(source, out, FiveSegments(), NULL, NULL));
  SPEECHSEG_ASSERT(NumLines(manifest) == 6);

  CancellationToken token;
  backend.cancel_ = &token;
  backend.cancel_at_ = "segment_2.wav";
  SPEECHSEG_ASSERT(!cutter.Cut(source, out, FiveSegments(), &token, NULL));
  SPEECHSEG_ASSERT(!FileExists(manifest));
  SPEECHSEG_ASSERT(!FileExists(manifest + ".tmp"));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_1.wav")));
  for (int32 n = 2; n <= 5; n++) {
    std::ostringstream name;
    name << "segment_" << n << ".wav";
    SPEECHSEG_ASSERT(!FileExists(JoinPath(out, name.str())));
  }
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

// Segments of an earlier run with more segments do not survive a rerun;
// files that are not ours are left alone.
void UnitTestSurplusRemoved() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  CutterOptions opts;
  ScriptedBackend backend;
  SegmentCutter cutter(opts, &backend);
  SPEECHSEG_ASSERT(cutter.Cut(source, out, FiveSegments(), NULL, NULL));
  {
    std::ofstream os(JoinPath(out, "segment_notes.wav").c_str());
    os << "not a numbered segment";
  }
  SegmentList three(FiveSegments());
  three.resize(3);
  SPEECHSEG_ASSERT(cutter.Cut(source, out, three, NULL, NULL));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_3.wav")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_4.wav")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_5.wav")));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_notes.wav")));
  SPEECHSEG_ASSERT(NumLines(JoinPath(out, "segment_all.csv")) == 4);

  // The same in subfolder mode, after a flat run.
  opts.segment_subfolders = true;
  SegmentCutter sub_cutter(opts, &backend);
  SPEECHSEG_ASSERT(sub_cutter.Cut(source, out, FiveSegments(), NULL, NULL));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_1.wav")));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_5/segment_5.wav")));
  SPEECHSEG_ASSERT(sub_cutter.Cut(source, out, three, NULL, NULL));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_3/segment_3.wav")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_4")));
  SPEECHSEG_ASSERT(!FileExists(JoinPath(out, "segment_5")));
  SPEECHSEG_ASSERT(FileExists(JoinPath(out, "segment_notes.wav")));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestRepeatable() {
  std::string dir = MakeTempDir(), source = WriteSource(dir),
      out = JoinPath(dir, "out");
  CutterOptions opts;
  ScriptedBackend backend;
  SegmentCutter cutter(opts, &backend);
  std::string manifest = JoinPath(out, "segment_all.csv");
  SPEECHSEG_ASSERT(cutter.Cut(source, out, FiveSegments(), NULL, NULL));
  std::ifstream is1(manifest.c_str());
  std::string first((std::istreambuf_iterator<char>(is1)),
                    std::istreambuf_iterator<char>());
  SPEECHSEG_ASSERT(cutter.Cut(source, out, FiveSegments(), NULL, NULL));
  std::ifstream is2(manifest.c_str());
  std::string second((std::istreambuf_iterator<char>(is2)),
                     std::istreambuf_iterator<char>());
  SPEECHSEG_ASSERT(!first.empty() && first == second);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestNaming();
  UnitTestCutFlat();
  UnitTestBatchFallback();
  UnitTestMissingBatchOutput();
  UnitTestSubfolders();
  UnitTestNoSegments();
  UnitTestCancelled();
  UnitTestCancelledInLastBatch();
  UnitTestCancelledRerun();
  UnitTestSurplusRemoved();
  UnitTestRepeatable();
  std::cout << "Test OK.\n";
  return 0;
}
