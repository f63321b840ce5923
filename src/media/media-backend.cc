// media/media-backend.cc

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

#include "media/media-backend.h"

#include <sstream>

namespace speechseg {

std::string MediaError::ToString() const {
  std::ostringstream os;
  os << (tool.empty() ? "media" : tool);
  if (exit_status >= 0)
    os << " exited with status " << exit_status;
  if (!message.empty()) {
    // Tools tend to end stderr with a newline; keep the log line single.
    std::string msg = message;
    while (!msg.empty() && (msg[msg.size() - 1] == '\n' ||
                            msg[msg.size() - 1] == '\r'))
      msg.erase(msg.size() - 1);
    for (size_t i = 0; i < msg.size(); i++)
      if (msg[i] == '\n') msg[i] = ' ';
    os << ": " << msg;
  }
  return os.str();
}

bool MediaBackend::ExtractBatch(const std::string &input,
                                const std::vector<ExtractRange> &ranges,
                                MediaError *error) {
  for (size_t i = 0; i < ranges.size(); i++)
    if (!Extract(input, ranges[i], error))
      return false;
  return true;
}

bool RunMediaTool(const std::string &tool_name,
                  const std::vector<std::string> &argv, MediaError *error) {
  SPEECHSEG_VLOG(3) << "Running: " << CommandToString(argv);
  CommandResult result;
  if (RunCommand(argv, &result))
    return true;
  if (error != NULL) {
    error->tool = tool_name;
    error->exit_status = result.exit_status;
    error->message = result.stderr_tail;
    if (result.term_signal != 0) {
      std::ostringstream os;
      os << "killed by signal " << result.term_signal;
      if (!result.stderr_tail.empty()) os << "; " << result.stderr_tail;
      error->message = os.str();
    }
  }
  return false;
}

}  // namespace speechseg
