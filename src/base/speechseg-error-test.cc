// base/speechseg-error-test.cc

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

// testing that we get the stack trace.
namespace speechseg {

void MyFunction2() { SPEECHSEG_ERR << "Ignore this error"; }

void MyFunction1() { MyFunction2(); }

void UnitTestError() {
  {
    std::cerr << "Ignore next error:\n";
    MyFunction1();
  }
}

void VerifySymbolRange(const std::string &trace, const bool want_found,
                       const std::string &want_symbol) {
  size_t begin, end;
  const bool found = internal::LocateSymbolRange(trace, &begin, &end);
  if (found != want_found) {
    SPEECHSEG_ERR << "Found mismatch, got " << found << " want " << want_found;
  }
  if (!found) {
    return;
  }
  const std::string symbol = trace.substr(begin, end - begin);
  if (symbol != want_symbol) {
    SPEECHSEG_ERR << "Symbol mismatch, got " << symbol << " want "
                  << want_symbol;
  }
}

void TestLocateSymbolRange() {
  VerifySymbolRange("", false, "");
  VerifySymbolRange(
      R"TRACE(./speechseg-error-test(_ZN9speechseg13UnitTestErrorEv+0xb) [0x804965d])TRACE",
      true, "_ZN9speechseg13UnitTestErrorEv");
  // It is ok thread_start is not found because it is a C symbol.
  VerifySymbolRange(
      R"TRACE(31  libsystem_pthread.dylib             0x00007fff6fe4e40d thread_start + 13)TRACE",
      false, "");
  VerifySymbolRange(
      R"TRACE(0 segment-audio-dir 0x000000010f67614d _ZNK9speechseg13MessageLogger10LogMessageEv + 813)TRACE",
      true, "_ZNK9speechseg13MessageLogger10LogMessageEv");
  VerifySymbolRange(
      R"TRACE(29  libsystem_pthread.dylib             0x00007fff6fe4f2eb _pthread_body + 126)TRACE",
      true, "_pthread_body");
}

static std::vector<std::string> captured_messages;
static std::vector<int> captured_severities;

static void CaptureMessage(const LogMessageEnvelope &envelope,
                           const char *message) {
  captured_severities.push_back(envelope.severity);
  captured_messages.push_back(message);
}

void TestLogHandler() {
  captured_messages.clear();
  captured_severities.clear();
  LogHandler old_handler = SetLogHandler(&CaptureMessage);
  SetVerboseLevel(1);
  SPEECHSEG_LOG << "info " << 1;
  SPEECHSEG_WARN << "warning";
  SPEECHSEG_VLOG(1) << "shown";
  SPEECHSEG_VLOG(2) << "hidden";
  bool thrown = false;
  try {
    SPEECHSEG_ERR << "fatal " << 2.5;
  } catch (const SpeechsegFatalError &e) {
    thrown = true;
    SPEECHSEG_ASSERT(std::string(e.SpeechsegMessage()) == "fatal 2.5");
    SPEECHSEG_ASSERT(std::string(e.what()) ==
                     "speechseg::SpeechsegFatalError");
  }
  SetVerboseLevel(0);
  SetLogHandler(old_handler);

  SPEECHSEG_ASSERT(thrown);
  SPEECHSEG_ASSERT(captured_messages.size() == 4);
  SPEECHSEG_ASSERT(captured_messages[0] == "info 1");
  SPEECHSEG_ASSERT(captured_severities[0] == LogMessageEnvelope::kInfo);
  SPEECHSEG_ASSERT(captured_severities[1] == LogMessageEnvelope::kWarning);
  SPEECHSEG_ASSERT(captured_messages[2] == "shown");
  SPEECHSEG_ASSERT(captured_severities[2] == 1);
  SPEECHSEG_ASSERT(captured_severities[3] == LogMessageEnvelope::kError);
}

void TestFormatLogPrefix() {
  SetProgramName("speechseg-error-test");
  LogMessageEnvelope envelope;
  envelope.severity = LogMessageEnvelope::kWarning;
  envelope.func = "Cut";
  envelope.file = "media/segment-cutter.cc";
  envelope.line = 42;
  std::string prefix = FormatLogPrefix(envelope);
  SPEECHSEG_ASSERT(prefix.compare(0, 9, "WARNING (") == 0);
  SPEECHSEG_ASSERT(prefix.find("speechseg-error-test") != std::string::npos);
  SPEECHSEG_ASSERT(prefix.find("Cut():media/segment-cutter.cc:42) ") !=
                   std::string::npos);
}

} // namespace speechseg

int main() {
  speechseg::TestLocateSymbolRange();
  speechseg::TestLogHandler();
  speechseg::TestFormatLogPrefix();

  speechseg::SetProgramName("/foo/bar/speechseg-error-test");
  try {
    speechseg::UnitTestError();
    SPEECHSEG_ASSERT(0); // should not happen.
    exit(1);
  } catch (speechseg::SpeechsegFatalError &e) {
    std::cout << "The error we generated was: '" << e.SpeechsegMessage()
              << "'\n";
  }
}
