// media/external-backends.cc

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

#include "media/external-backends.h"

#include <sstream>

#include "util/text-utils.h"

namespace speechseg {

static std::string IntToString(int32 i) {
  std::ostringstream os;
  os << i;
  return os.str();
}

std::vector<std::string> FfmpegBackend::ConvertArgs(
    const std::string &input, const std::string &output,
    const AudioFormat &format) const {
  SPEECHSEG_ASSERT(format.bits_per_sample == 16);
  std::vector<std::string> args;
  args.push_back(binary_);
  args.push_back("-hide_banner");
  args.push_back("-loglevel");
  args.push_back("error");
  args.push_back("-y");
  args.push_back("-i");
  args.push_back(input);
  args.push_back("-acodec");
  args.push_back("pcm_s16le");
  args.push_back("-ac");
  args.push_back(IntToString(format.num_channels));
  args.push_back("-ar");
  args.push_back(IntToString(format.sample_rate));
  args.push_back(output);
  return args;
}

std::vector<std::string> FfmpegBackend::ExtractArgs(
    const std::string &input, const ExtractRange &range) const {
  std::vector<std::string> args;
  args.push_back(binary_);
  args.push_back("-hide_banner");
  args.push_back("-loglevel");
  args.push_back("error");
  args.push_back("-y");
  args.push_back("-ss");
  args.push_back(FormatSeconds(range.start_sec));
  args.push_back("-to");
  args.push_back(FormatSeconds(range.end_sec));
  args.push_back("-i");
  args.push_back(input);
  args.push_back("-acodec");
  args.push_back("copy");
  args.push_back(range.output);
  return args;
}

std::vector<std::string> FfmpegBackend::ExtractBatchArgs(
    const std::string &input, const std::vector<ExtractRange> &ranges) const {
  std::vector<std::string> args;
  args.push_back(binary_);
  args.push_back("-hide_banner");
  args.push_back("-loglevel");
  args.push_back("error");
  args.push_back("-y");
  args.push_back("-i");
  args.push_back(input);
  // Options before each output file apply to that output only.
  for (size_t i = 0; i < ranges.size(); i++) {
    args.push_back("-ss");
    args.push_back(FormatSeconds(ranges[i].start_sec));
    args.push_back("-to");
    args.push_back(FormatSeconds(ranges[i].end_sec));
    args.push_back("-acodec");
    args.push_back("copy");
    args.push_back(ranges[i].output);
  }
  return args;
}

bool FfmpegBackend::Convert(const std::string &input,
                            const std::string &output,
                            const AudioFormat &format, MediaError *error) {
  return RunMediaTool(Name(), ConvertArgs(input, output, format), error);
}

bool FfmpegBackend::Extract(const std::string &input,
                            const ExtractRange &range, MediaError *error) {
  return RunMediaTool(Name(), ExtractArgs(input, range), error);
}

bool FfmpegBackend::ExtractBatch(const std::string &input,
                                 const std::vector<ExtractRange> &ranges,
                                 MediaError *error) {
  if (ranges.empty()) return true;
  return RunMediaTool(Name(), ExtractBatchArgs(input, ranges), error);
}

std::vector<std::string> SoxBackend::ConvertArgs(
    const std::string &input, const std::string &output,
    const AudioFormat &format) const {
  SPEECHSEG_ASSERT(format.bits_per_sample == 16);
  std::vector<std::string> args;
  args.push_back(binary_);
  args.push_back("-q");
  args.push_back(input);
  args.push_back("-r");
  args.push_back(IntToString(format.sample_rate));
  args.push_back("-c");
  args.push_back(IntToString(format.num_channels));
  args.push_back("-b");
  args.push_back("16");
  args.push_back("-e");
  args.push_back("signed-integer");
  args.push_back(output);
  return args;
}

std::vector<std::string> SoxBackend::ExtractArgs(
    const std::string &input, const ExtractRange &range) const {
  std::vector<std::string> args;
  args.push_back(binary_);
  args.push_back("-q");
  args.push_back(input);
  args.push_back(range.output);
  args.push_back("trim");
  args.push_back(FormatSeconds(range.start_sec));
  args.push_back("=" + FormatSeconds(range.end_sec));
  return args;
}

bool SoxBackend::Convert(const std::string &input, const std::string &output,
                         const AudioFormat &format, MediaError *error) {
  return RunMediaTool(Name(), ConvertArgs(input, output, format), error);
}

bool SoxBackend::Extract(const std::string &input, const ExtractRange &range,
                         MediaError *error) {
  return RunMediaTool(Name(), ExtractArgs(input, range), error);
}

}  // namespace speechseg
