// media/resampler-test.cc

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

#include "media/resampler.h"
#include "util/file-utils.h"

namespace speechseg {

// Writes "name" into the output, or fails after leaving a partial file.
class FakeConverter: public MediaBackend {
 public:
  FakeConverter(const std::string &name, bool succeed):
      name_(name), succeed_(succeed), num_calls_(0) { }
  virtual std::string Name() const { return name_; }
  virtual bool Convert(const std::string &input, const std::string &output,
                       const AudioFormat &format, MediaError *error) {
    num_calls_++;
    last_format_ = format;
    std::ofstream os(output.c_str());
    os << name_;
    if (succeed_) return true;
    error->tool = name_;
    error->exit_status = 1;
    error->message = name_ + " cannot read " + input;
    return false;
  }
  virtual bool Extract(const std::string &input, const ExtractRange &range,
                       MediaError *error) {
    return false;
  }
  int32 NumCalls() const { return num_calls_; }
  const AudioFormat &LastFormat() const { return last_format_; }
 private:
  std::string name_;
  bool succeed_;
  int32 num_calls_;
  AudioFormat last_format_;
};

static std::string ReadAll(const std::string &filename) {
  std::ifstream is(filename.c_str());
  std::string ans;
  std::getline(is, ans);
  return ans;
}

void UnitTestResampleOptions() {
  ResampleOptions opts;
  opts.Check();
  SPEECHSEG_ASSERT(opts.Format().sample_rate == 16000);
  int32 bad_rates[] = { 0, 11025, 22050, 44100 };
  for (size_t i = 0; i < 4; i++) {
    opts.sample_rate = bad_rates[i];
    bool threw = false;
    try {
      opts.Check();
    } catch (const SpeechsegFatalError &e) {
      threw = true;
    }
    SPEECHSEG_ASSERT(threw);
  }
  opts.sample_rate = 8000;
  opts.channels = 2;
  bool threw = false;
  try {
    opts.Check();
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

void UnitTestFallback() {
  char tmpl[] = "/tmp/speechseg-resampler-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl, dest = JoinPath(dir, "a.wav");
  ResampleOptions opts;
  opts.sample_rate = 8000;

  {  // Primary works; fallback is not touched.
    FakeConverter primary("primary", true), fallback("fallback", true);
    Resampler resampler(opts, &primary, &fallback);
    SPEECHSEG_ASSERT(resampler.Resample("src/a.wav", dest, NULL));
    SPEECHSEG_ASSERT(primary.NumCalls() == 1 && fallback.NumCalls() == 0);
    SPEECHSEG_ASSERT(primary.LastFormat().sample_rate == 8000);
    SPEECHSEG_ASSERT(primary.LastFormat().num_channels == 1);
    SPEECHSEG_ASSERT(ReadAll(dest) == "primary");
  }
  {  // Primary fails; fallback overwrites its partial output.
    FakeConverter primary("primary", false), fallback("fallback", true);
    Resampler resampler(opts, &primary, &fallback);
    MediaError error;
    SPEECHSEG_ASSERT(resampler.Resample("src/a.wav", dest, &error));
    SPEECHSEG_ASSERT(primary.NumCalls() == 1 && fallback.NumCalls() == 1);
    SPEECHSEG_ASSERT(ReadAll(dest) == "fallback");
  }
  {  // Both fail: error from the fallback, no output left behind.
    FakeConverter primary("primary", false), fallback("fallback", false);
    Resampler resampler(opts, &primary, &fallback);
    MediaError error;
    SPEECHSEG_ASSERT(!resampler.Resample("src/a.wav", dest, &error));
    SPEECHSEG_ASSERT(error.tool == "fallback" && error.exit_status == 1);
    SPEECHSEG_ASSERT(!FileExists(dest));
  }
  {  // No fallback.
    FakeConverter primary("primary", false);
    Resampler resampler(opts, &primary, NULL);
    MediaError error;
    SPEECHSEG_ASSERT(!resampler.Resample("src/a.wav", dest, &error));
    SPEECHSEG_ASSERT(error.tool == "primary");
    SPEECHSEG_ASSERT(!FileExists(dest));
  }
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestResampleOptions();
  UnitTestFallback();
  std::cout << "Test OK.\n";
  return 0;
}
