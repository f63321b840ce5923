// util/log-sink-test.cc

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

#include <stdlib.h>

#include <fstream>
#include <thread>

#include "base/speechseg-common.h"
#include "util/file-utils.h"
#include "util/log-sink.h"
#include "util/text-utils.h"

namespace speechseg {

static std::vector<std::string> ReadLines(const std::string &filename) {
  std::ifstream is(filename.c_str());
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(is, line)) lines.push_back(line);
  return lines;
}

void UnitTestLogFileSink() {
  char tmpl[] = "/tmp/speechseg-log-sink-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string root = tmpl, log_file = JoinPath(root, "speechseg.log");
  {
    std::ofstream os(log_file.c_str());
    os << "left over from an earlier run\n";
  }
  {
    LogFileSink sink;
    SPEECHSEG_ASSERT(!sink.IsOpen());
    SPEECHSEG_ASSERT(sink.Open(log_file));
    SPEECHSEG_ASSERT(sink.IsOpen());
    SPEECHSEG_LOG << "first";
    SPEECHSEG_WARN << "second";
    SPEECHSEG_VLOG(5) << "not logged";
    try {
      SPEECHSEG_ERR << "third";
      SPEECHSEG_ASSERT(0);
    } catch (const SpeechsegFatalError &) { }

    // A second sink cannot be installed while the first is active.
    LogFileSink other;
    SPEECHSEG_ASSERT(!other.Open(JoinPath(root, "other.log")));
    SPEECHSEG_ASSERT(!other.IsOpen());
  }
  SPEECHSEG_LOG << "after the sink is gone";

  std::vector<std::string> lines = ReadLines(log_file);
  // The failed Open() of the second sink warned through the first one.
  SPEECHSEG_ASSERT(lines.size() == 4);
  SPEECHSEG_ASSERT(lines[0].compare(0, 5, "LOG (") == 0);
  SPEECHSEG_ASSERT(EndsWith(lines[0], ") first"));
  SPEECHSEG_ASSERT(lines[1].compare(0, 9, "WARNING (") == 0);
  SPEECHSEG_ASSERT(EndsWith(lines[1], ") second"));
  SPEECHSEG_ASSERT(lines[2].compare(0, 7, "ERROR (") == 0);
  SPEECHSEG_ASSERT(EndsWith(lines[2], ") third"));

  SPEECHSEG_ASSERT(RemoveTree(root));
}

void UnitTestLogFileSinkThreads() {
  char tmpl[] = "/tmp/speechseg-log-sink-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string root = tmpl, log_file = JoinPath(root, "threads.log");
  const int32 num_threads = 4, num_messages = 50;
  {
    LogFileSink sink;
    SPEECHSEG_ASSERT(sink.Open(log_file));
    std::vector<std::thread> threads;
    for (int32 t = 0; t < num_threads; t++)
      threads.push_back(std::thread([t]() {
            for (int32 i = 0; i < num_messages; i++)
              SPEECHSEG_LOG << "thread " << t << " message " << i;
          }));
    for (size_t t = 0; t < threads.size(); t++) threads[t].join();
  }
  std::vector<std::string> lines = ReadLines(log_file);
  SPEECHSEG_ASSERT(lines.size() == num_threads * num_messages);
  for (size_t i = 0; i < lines.size(); i++)
    SPEECHSEG_ASSERT(lines[i].compare(0, 5, "LOG (") == 0);
  SPEECHSEG_ASSERT(RemoveTree(root));
}

void UnitTestLogFileSinkBadPath() {
  LogFileSink sink;
  SPEECHSEG_ASSERT(!sink.Open("/nonexistent-speechseg-dir/x.log"));
  SPEECHSEG_ASSERT(!sink.IsOpen());
  sink.Close();  // no-op
}

}  // end namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestLogFileSink();
  UnitTestLogFileSinkThreads();
  UnitTestLogFileSinkBadPath();
  std::cout << "Test OK.\n";
  return 0;
}
