// util/subprocess.h

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

#ifndef SPEECHSEG_UTIL_SUBPROCESS_H_
#define SPEECHSEG_UTIL_SUBPROCESS_H_

#include <string>
#include <vector>

#include "base/speechseg-common.h"

namespace speechseg {

/// Outcome of one external command.
struct CommandResult {
  int32 exit_status;      // exit code, or -1 if the command did not exit.
  int32 term_signal;      // signal that killed it, or 0.
  std::string stderr_tail;  // last few kilobytes the command wrote to stderr.

  CommandResult(): exit_status(-1), term_signal(0) { }

  bool Succeeded() const { return exit_status == 0 && term_signal == 0; }
};

/// Runs argv[0] (looked up in PATH) with the given arguments, without a
/// shell, and waits for it to finish.  stdin and stdout are connected to
/// /dev/null; stderr is captured into result->stderr_tail.  Returns false if
/// the command could not be started or did not exit with status 0.  Safe to
/// call from several threads at once.
bool RunCommand(const std::vector<std::string> &argv, CommandResult *result);

/// Returns the command line as it could be pasted into a shell, for logging.
std::string CommandToString(const std::vector<std::string> &argv);

}  // namespace speechseg

#endif  // SPEECHSEG_UTIL_SUBPROCESS_H_
