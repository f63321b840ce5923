// media/external-backends-test.cc

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

#include "base/speechseg-common.h"
#include "media/external-backends.h"
#include "media/media-toolchain.h"
#include "util/subprocess.h"

namespace speechseg {

void UnitTestFfmpegArgs() {
  FfmpegBackend ffmpeg("/opt/ffmpeg/bin/ffmpeg");
  SPEECHSEG_ASSERT(ffmpeg.Name() == "ffmpeg" && ffmpeg.SupportsBatchExtract());
  std::string convert = CommandToString(
      ffmpeg.ConvertArgs("in dir/a.wav", "temp/a.wav", AudioFormat()));
  SPEECHSEG_ASSERT(convert == "/opt/ffmpeg/bin/ffmpeg -hide_banner -loglevel "
                   "error -y -i 'in dir/a.wav' -acodec pcm_s16le -ac 1 "
                   "-ar 16000 temp/a.wav");

  std::string extract = CommandToString(
      ffmpeg.ExtractArgs("a.mp3", ExtractRange(1.5, 2.25, "out/s_1.mp3")));
  SPEECHSEG_ASSERT(extract == "/opt/ffmpeg/bin/ffmpeg -hide_banner -loglevel "
                   "error -y -ss 1.5 -to 2.25 -i a.mp3 -acodec copy "
                   "out/s_1.mp3");

  std::vector<ExtractRange> ranges;
  ranges.push_back(ExtractRange(0.0, 1.0, "s_1.wav"));
  ranges.push_back(ExtractRange(2.0, 3.25, "s_2.wav"));
  std::string batch = CommandToString(ffmpeg.ExtractBatchArgs("a.wav",
                                                              ranges));
  SPEECHSEG_ASSERT(batch == "/opt/ffmpeg/bin/ffmpeg -hide_banner -loglevel "
                   "error -y -i a.wav -ss 0.0 -to 1.0 -acodec copy s_1.wav "
                   "-ss 2.0 -to 3.25 -acodec copy s_2.wav");
}

void UnitTestSoxArgs() {
  SoxBackend sox("sox");
  SPEECHSEG_ASSERT(sox.Name() == "sox" && !sox.SupportsBatchExtract());
  std::string convert = CommandToString(
      sox.ConvertArgs("a.flac", "t/a.flac", AudioFormat(8000, 16, 1)));
  SPEECHSEG_ASSERT(convert == "sox -q a.flac -r 8000 -c 1 -b 16 -e "
                   "signed-integer t/a.flac");
  std::string extract = CommandToString(
      sox.ExtractArgs("a.wav", ExtractRange(0.51, 1.2, "s_1.wav")));
  SPEECHSEG_ASSERT(extract == "sox -q a.wav s_1.wav trim 0.51 =1.2");
}

// A backend whose program cannot be started reports exit status 127.
void UnitTestMissingProgram() {
  FfmpegBackend ffmpeg("/nonexistent/speechseg-test/ffmpeg");
  MediaError error;
  SPEECHSEG_ASSERT(!ffmpeg.Convert("a.wav", "b.wav", AudioFormat(), &error));
  SPEECHSEG_ASSERT(error.tool == "ffmpeg");
  SPEECHSEG_ASSERT(error.exit_status == 127);
  SPEECHSEG_ASSERT(error.ToString().find("ffmpeg exited with status 127") ==
                   0);
  SoxBackend sox("/nonexistent/speechseg-test/sox");
  error.Clear();
  SPEECHSEG_ASSERT(!sox.Extract("a.wav", ExtractRange(0, 1, "b.wav"),
                                &error));
  SPEECHSEG_ASSERT(error.tool == "sox" && error.exit_status == 127);
}

void UnitTestRunMediaTool() {
  std::vector<std::string> argv;
  argv.push_back("sh");
  argv.push_back("-c");
  argv.push_back("echo 'Invalid data found' >&2; exit 1");
  MediaError error;
  SPEECHSEG_ASSERT(!RunMediaTool("fake", argv, &error));
  SPEECHSEG_ASSERT(error.tool == "fake" && error.exit_status == 1);
  SPEECHSEG_ASSERT(error.message == "Invalid data found\n");
  SPEECHSEG_ASSERT(error.ToString() ==
                   "fake exited with status 1: Invalid data found");
  argv[2] = "exit 0";
  SPEECHSEG_ASSERT(RunMediaTool("fake", argv, NULL));
}

void UnitTestToolchain() {
  MediaToolOptions opts;
  MediaToolchain external(opts);
  SPEECHSEG_ASSERT(external.Primary()->Name() == "ffmpeg");
  SPEECHSEG_ASSERT(external.Fallback() != NULL &&
                   external.Fallback()->Name() == "sox");
  opts.media_backend = "wave";
  MediaToolchain wave(opts);
  SPEECHSEG_ASSERT(wave.Primary()->Name() == "wave");
  SPEECHSEG_ASSERT(wave.Fallback() == NULL);
  opts.media_backend = "gstreamer";
  bool threw = false;
  try {
    MediaToolchain bad(opts);
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestFfmpegArgs();
  UnitTestSoxArgs();
  UnitTestMissingProgram();
  UnitTestRunMediaTool();
  UnitTestToolchain();
  std::cout << "Test OK.\n";
  return 0;
}
