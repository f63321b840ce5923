// util/log-sink.cc

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

#include "util/log-sink.h"

#include <iostream>

namespace speechseg {

LogFileSink *LogFileSink::active_sink_ = NULL;

LogFileSink::LogFileSink(): previous_handler_(NULL), is_open_(false) { }

bool LogFileSink::Open(const std::string &filename) {
  Close();
  if (active_sink_ != NULL) {
    SPEECHSEG_WARN << "Another log file sink is already installed.";
    return false;
  }
  os_.open(filename.c_str(), std::ios::out | std::ios::trunc);
  if (!os_.is_open()) {
    SPEECHSEG_WARN << "Could not open log file " << filename;
    return false;
  }
  is_open_ = true;
  active_sink_ = this;
  previous_handler_ = SetLogHandler(&LogFileSink::HandleMessage);
  return true;
}

void LogFileSink::Close() {
  if (!is_open_) return;
  SetLogHandler(previous_handler_);
  previous_handler_ = NULL;
  active_sink_ = NULL;
  std::lock_guard<std::mutex> lock(mutex_);
  os_.flush();
  os_.close();
  is_open_ = false;
}

void LogFileSink::Write(const std::string &line) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << line;
  if (os_.is_open()) {
    os_ << line;
    os_.flush();
  }
}

void LogFileSink::HandleMessage(const LogMessageEnvelope &envelope,
                                const char *message) {
  std::string line = FormatLogPrefix(envelope) + message + "\n";
  LogFileSink *sink = active_sink_;
  if (sink != NULL)
    sink->Write(line);
  else
    std::cerr << line;
}

}  // namespace speechseg
