// base/speechseg-error.h

// Copyright 2019 LAIX (Yi Sun)
// Copyright 2019 SmartAction LLC (kkm)
// Copyright 2016 Brno University of Technology (author: Karel Vesely)
// Copyright 2009-2011  Microsoft Corporation;  Ondrej Glembek;  Lukas Burget;
//                      Saarland University
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

#ifndef SPEECHSEG_BASE_SPEECHSEG_ERROR_H_
#define SPEECHSEG_BASE_SPEECHSEG_ERROR_H_ 1

#include <cstdio>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "base/speechseg-types.h"
#include "base/speechseg-utils.h"
/* Important that this file does not depend on any other speechseg headers. */

namespace speechseg {

/// \addtogroup error_group
/// @{

/***** PROGRAM NAME AND VERBOSITY LEVEL *****/

/// Called by ParseOptions to set base name (no directory) of the executing
/// program. The name is printed in logging code along with every message,
/// because the batch tools are often run side by side with their stderr
/// mixed together.  This function is very thread-unsafe.
void SetProgramName(const char *basename);

/// This is set by util/parse-options.{h,cc} if you set --verbose=? option.
/// Do not use directly, prefer {Get,Set}VerboseLevel().
extern int32 g_speechseg_verbose_level;

/// Get verbosity level, usually set via command line '--verbose=' switch.
inline int32 GetVerboseLevel() { return g_speechseg_verbose_level; }

/// This should be rarely used; command-line programs set the verbose level
/// automatically from ParseOptions.
inline void SetVerboseLevel(int32 i) { g_speechseg_verbose_level = i; }

/***** LOGGING *****/

/// Log message severity and source location info.
struct LogMessageEnvelope {
  /// Message severity. In addition to these levels, positive values (1 to 6)
  /// specify verbose logging level. Verbose messages are produced only when
  /// SetVerboseLevel() has been called to set logging level to at least the
  /// corresponding value.
  enum Severity {
    kAssertFailed = -3, //!< Assertion failure. abort() will be called.
    kError = -2,        //!< Fatal error. SpeechsegFatalError will be thrown.
    kWarning = -1,      //!< Indicates a recoverable but abnormal condition.
    kInfo = 0,          //!< Informational message.
  };
  int severity;     //!< A Severity value, or positive verbosity level.
  const char *func; //!< Name of the function invoking the logging.
  const char *file; //!< Source file name with up to 1 leading directory.
  int32 line;       //<! Line number in the source file.
};

/// Fatal runtime error exception. This exception is thrown from any use of
/// the SPEECHSEG_ERR logging macro after the logging function, either set by
/// SetLogHandler(), or the internal one, has returned.
class SpeechsegFatalError : public std::runtime_error {
public:
  explicit SpeechsegFatalError(const std::string &message)
      : std::runtime_error(message) {}
  explicit SpeechsegFatalError(const char *message)
      : std::runtime_error(message) {}

  /// Returns the exception name, "speechseg::SpeechsegFatalError".
  virtual const char *what() const noexcept override {
    return "speechseg::SpeechsegFatalError";
  }

  /// Returns the error message logged by SPEECHSEG_ERR.
  const char *SpeechsegMessage() const { return std::runtime_error::what(); }
};

// Class MessageLogger is the workhorse behind the SPEECHSEG_ASSERT,
// SPEECHSEG_ERR, SPEECHSEG_WARN, SPEECHSEG_LOG and SPEECHSEG_VLOG macros. It
// formats the message, then either prints it to stderr or passes to the
// custom logging handler if provided. Then, in case of the error, throws a
// SpeechsegFatalError exception, or in case of failed SPEECHSEG_ASSERT, calls
// std::abort().
class MessageLogger {
public:
  /// The constructor stores the message's "envelope", a set of data which
  // identifies the location in source which is sending the message to log.
  // The pointers to strings are stored internally, and not owned or copied,
  // so that their storage must outlive this object.
  MessageLogger(LogMessageEnvelope::Severity severity, const char *func,
                const char *file, int32 line);

  // The stream insertion operator, used in e.g. 'SPEECHSEG_LOG << "Message"'.
  template <typename T> MessageLogger &operator<<(const T &val) {
    ss_ << val;
    return *this;
  }

  // When assigned a MessageLogger, log its contents.
  struct Log final {
    void operator=(const MessageLogger &logger) { logger.LogMessage(); }
  };

  // When assigned a MessageLogger, log its contents and then throw
  // a SpeechsegFatalError.
  struct LogAndThrow final {
    [[noreturn]] void operator=(const MessageLogger &logger) {
      logger.LogMessage();
      throw SpeechsegFatalError(logger.GetMessage());
    }
  };

private:
  std::string GetMessage() const { return ss_.str(); }
  void LogMessage() const;

  LogMessageEnvelope envelope_;
  std::ostringstream ss_;
};

// Logging macros.
#define SPEECHSEG_ERR                                                          \
  ::speechseg::MessageLogger::LogAndThrow() = ::speechseg::MessageLogger(      \
      ::speechseg::LogMessageEnvelope::kError, __func__, __FILE__, __LINE__)
#define SPEECHSEG_WARN                                                         \
  ::speechseg::MessageLogger::Log() = ::speechseg::MessageLogger(              \
      ::speechseg::LogMessageEnvelope::kWarning, __func__, __FILE__, __LINE__)
#define SPEECHSEG_LOG                                                          \
  ::speechseg::MessageLogger::Log() = ::speechseg::MessageLogger(              \
      ::speechseg::LogMessageEnvelope::kInfo, __func__, __FILE__, __LINE__)
#define SPEECHSEG_VLOG(v)                                                      \
  if ((v) <= ::speechseg::GetVerboseLevel())                                   \
  ::speechseg::MessageLogger::Log() =                                          \
      ::speechseg::MessageLogger(                                              \
          (::speechseg::LogMessageEnvelope::Severity)(v),                      \
          __func__, __FILE__, __LINE__)

/***** ASSERTS *****/

[[noreturn]] void SpeechsegAssertFailure_(const char *func, const char *file,
                                          int32 line, const char *cond_str);

// do {} while(0) -- note there is no semicolon at the end! -- so that the
// macro can be used as the body of an unbraced if/else.
#ifndef NDEBUG
#define SPEECHSEG_ASSERT(cond)                                                 \
  do {                                                                         \
    if (cond)                                                                  \
      (void)0;                                                                 \
    else                                                                       \
      ::speechseg::SpeechsegAssertFailure_(__func__, __FILE__, __LINE__,       \
                                           #cond);                             \
  } while (0)
#else
#define SPEECHSEG_ASSERT(cond) (void)0
#endif

/***** THIRD-PARTY LOG-HANDLER *****/

/// Type of third-party logging function.
typedef void (*LogHandler)(const LogMessageEnvelope &envelope,
                           const char *message);

/// Set logging handler. If called with a non-NULL function pointer, the
/// function pointed by it is called to send messages to a caller-provided log.
/// If called with a NULL pointer, restores default error logging to stderr.
/// This function is obviously not thread safe; the log handler must be.
/// Returns a previously set logging handler pointer, or NULL.
LogHandler SetLogHandler(LogHandler);

/// Formats the "LOG (prog[ver]:func():file:line) " prefix the default handler
/// prints, so that custom handlers can produce identical lines.
std::string FormatLogPrefix(const LogMessageEnvelope &envelope);

/// @} end "addtogroup error_group"

// Functions within internal is exported for testing only, do not use.
namespace internal {
bool LocateSymbolRange(const std::string &trace_name, size_t *begin,
                       size_t *end);
} // namespace internal
} // namespace speechseg

#endif // SPEECHSEG_BASE_SPEECHSEG_ERROR_H_
