// util/log-sink.h

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

#ifndef SPEECHSEG_UTIL_LOG_SINK_H_
#define SPEECHSEG_UTIL_LOG_SINK_H_

#include <fstream>
#include <mutex>
#include <string>

#include "base/speechseg-common.h"

namespace speechseg {

/**
   LogFileSink sends every message of the SPEECHSEG_LOG family both to stderr
   and to a log file, for the lifetime of the object.  The file is truncated
   when the sink is opened.  Only one sink can be installed at a time; the
   handler that was installed before is restored by the destructor.

   \code
     LogFileSink sink;
     if (!sink.Open("speechseg.log")) ...
     // ... run the batch ...
   \endcode
 */
class LogFileSink {
 public:
  LogFileSink();

  /// Opens (truncating) "filename" and installs the sink as the log handler.
  /// Returns false, with a warning, if the file cannot be opened.
  bool Open(const std::string &filename);

  /// Restores the previous handler and flushes and closes the file.
  void Close();

  bool IsOpen() const { return is_open_; }

  ~LogFileSink() { Close(); }

 private:
  static void HandleMessage(const LogMessageEnvelope &envelope,
                            const char *message);
  void Write(const std::string &line);

  static LogFileSink *active_sink_;

  std::ofstream os_;
  std::mutex mutex_;
  LogHandler previous_handler_;
  bool is_open_;

  SPEECHSEG_DISALLOW_COPY_AND_ASSIGN(LogFileSink);
};

}  // namespace speechseg

#endif  // SPEECHSEG_UTIL_LOG_SINK_H_
