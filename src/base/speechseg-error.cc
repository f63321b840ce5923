// base/speechseg-error.cc

// Copyright 2019 LAIX (Yi Sun)
// Copyright 2019 SmartAction LLC (kkm)
// Copyright 2016 Brno University of Technology (author: Karel Vesely)
// Copyright 2009-2011  Microsoft Corporation;  Lukas Burget;  Ondrej Glembek
// Copyright 2026 The speechseg Authors

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

#ifdef HAVE_EXECINFO_H
#include <execinfo.h> // To get stack trace in error messages.
#ifdef HAVE_CXXABI_H
#include <cxxabi.h> // For name demangling.
#endif // HAVE_CXXABI_H
#endif // HAVE_EXECINFO_H

#include <cstdlib>
#include <iostream>

#include "base/speechseg-common.h"
#include "base/speechseg-error.h"

// Normally passed in by the build files.
#ifndef SPEECHSEG_VERSION
#define SPEECHSEG_VERSION "unknown"
#endif

namespace speechseg {

/***** GLOBAL VARIABLES FOR LOGGING *****/

int32 g_speechseg_verbose_level = 0;
static std::string program_name;
static LogHandler log_handler = NULL;

void SetProgramName(const char *basename) {
  program_name = basename;
}

/***** HELPER FUNCTIONS *****/

// Trim filename to at most 1 trailing directory long. Given a filename like
// "/a/b/c/d/e/f.cc", return "e/f.cc".
static const char *GetShortFileName(const char *path) {
  if (path == nullptr)
    return "";

  const char *prev = path, *last = path;
  while ((path = std::strpbrk(path, "\\/")) != nullptr) {
    ++path;
    prev = last;
    last = path;
  }
  return prev;
}

/***** STACK TRACE *****/

namespace internal {
bool LocateSymbolRange(const std::string &trace_name, size_t *begin,
                       size_t *end) {
  // Find the first '_' with leading ' ' or '('.
  *begin = std::string::npos;
  for (size_t i = 1; i < trace_name.size(); i++) {
    if (trace_name[i] != '_') {
      continue;
    }
    if (trace_name[i - 1] == ' ' || trace_name[i - 1] == '(') {
      *begin = i;
      break;
    }
  }
  if (*begin == std::string::npos) {
    return false;
  }
  *end = trace_name.find_first_of(" +", *begin);
  return *end != std::string::npos;
}
} // namespace internal

#ifdef HAVE_EXECINFO_H
static std::string Demangle(std::string trace_name) {
#ifndef HAVE_CXXABI_H
  return trace_name;
#else  // HAVE_CXXABI_H
  // Linux traces look like
  //   ./speechseg-error-test(_ZN9speechseg13UnitTestErrorEv+0xb) [0x804965d]
  // and we want the mangled name between '(' and '+'.
  size_t begin, end;
  if (!internal::LocateSymbolRange(trace_name, &begin, &end)) {
    return trace_name;
  }
  std::string symbol = trace_name.substr(begin, end - begin);
  int status;
  char *demangled_name = abi::__cxa_demangle(symbol.c_str(), 0, 0, &status);
  if (status == 0 && demangled_name != nullptr) {
    symbol = demangled_name;
    free(demangled_name);
  }
  return trace_name.substr(0, begin) + symbol +
         trace_name.substr(end, std::string::npos);
#endif // HAVE_CXXABI_H
}
#endif // HAVE_EXECINFO_H

static std::string GetStackTrace() {
  std::string ans;
#ifdef HAVE_EXECINFO_H
  const size_t kMaxTraceSize = 50;
  void *trace[kMaxTraceSize];
  size_t size = backtrace(trace, kMaxTraceSize);
  char **trace_symbol = backtrace_symbols(trace, size);
  if (trace_symbol == NULL)
    return ans;

  ans += "[ Stack-Trace: ]\n";
  for (size_t i = 0; i < size; i++) {
    ans += Demangle(trace_symbol[i]) + "\n";
  }
  if (size == kMaxTraceSize)
    ans += ".\n.\n.\n"; // Stack was too long, probably a bug.

  // We must free the array of pointers allocated by backtrace_symbols(),
  // but not the strings themselves.
  free(trace_symbol);
#endif // HAVE_EXECINFO_H
  return ans;
}

/***** LOGGING *****/

std::string FormatLogPrefix(const LogMessageEnvelope &envelope) {
  std::ostringstream prefix;
  if (envelope.severity > LogMessageEnvelope::kInfo) {
    prefix << "VLOG[" << envelope.severity << "] (";
  } else {
    switch (envelope.severity) {
    case LogMessageEnvelope::kInfo:
      prefix << "LOG (";
      break;
    case LogMessageEnvelope::kWarning:
      prefix << "WARNING (";
      break;
    case LogMessageEnvelope::kAssertFailed:
      prefix << "ASSERTION_FAILED (";
      break;
    case LogMessageEnvelope::kError:
    default: // If not the ERROR, it still an error!
      prefix << "ERROR (";
      break;
    }
  }
  prefix << program_name << "[" SPEECHSEG_VERSION "]" << ':'
         << envelope.func << "():" << envelope.file << ':'
         << envelope.line << ") ";
  return prefix.str();
}

MessageLogger::MessageLogger(LogMessageEnvelope::Severity severity,
                             const char *func, const char *file, int32 line) {
  // Obviously, we assume the strings survive the destruction of this object.
  envelope_.severity = severity;
  envelope_.func = func;
  envelope_.file = GetShortFileName(file); // Points inside 'file'.
  envelope_.line = line;
}

void MessageLogger::LogMessage() const {
  // Send to the logging handler if provided.
  if (log_handler != NULL) {
    log_handler(envelope_, GetMessage().c_str());
    return;
  }

  std::stringstream full_message;
  full_message << FormatLogPrefix(envelope_) << GetMessage();

  // Add stack trace for errors and assertion failures, if available.
  if (envelope_.severity < LogMessageEnvelope::kWarning) {
    const std::string &stack_trace = GetStackTrace();
    if (!stack_trace.empty()) {
      full_message << "\n\n" << stack_trace;
    }
  }

  // One write per message, so that lines from worker threads do not
  // interleave.
  full_message << "\n";
  std::cerr << full_message.str();
}

/***** ASSERTS *****/

void SpeechsegAssertFailure_(const char *func, const char *file, int32 line,
                             const char *cond_str) {
  MessageLogger::Log() =
      MessageLogger(LogMessageEnvelope::kAssertFailed, func, file, line)
      << "Assertion failed: (" << cond_str << ")";
  fflush(NULL); // Flush all pending buffers, abort() may not flush stderr.
  std::abort();
}

/***** THIRD-PARTY LOG-HANDLER *****/

LogHandler SetLogHandler(LogHandler handler) {
  LogHandler old_handler = log_handler;
  log_handler = handler;
  return old_handler;
}

} // namespace speechseg
