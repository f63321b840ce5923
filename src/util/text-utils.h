// util/text-utils.h

// Copyright 2009-2011  Saarland University;  Microsoft Corporation
//           2026       The speechseg Authors

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

#ifndef SPEECHSEG_UTIL_TEXT_UTILS_H_
#define SPEECHSEG_UTIL_TEXT_UTILS_H_

#include <errno.h>
#include <stdlib.h>

#include <cctype>
#include <limits>
#include <string>
#include <vector>

#include "base/speechseg-common.h"

namespace speechseg {

/// Converts a string into an integer via strtoll and returns false if there
/// was any kind of problem (i.e. the string was not an integer or contained
/// extra non-whitespace junk, or the integer was too large to fit into the
/// type it is being converted into).  Only sets *out if everything was OK.
template<class Int>
bool ConvertStringToInteger(const std::string &str,
                            Int *out) {
  const char *this_str = str.c_str();
  char *end = NULL;
  errno = 0;
  int64 i = strtoll(this_str, &end, 10);
  if (end != this_str)
    while (isspace(*end)) end++;
  if (end == this_str || *end != '\0' || errno != 0)
    return false;
  Int iInt = static_cast<Int>(i);
  if (static_cast<int64>(iInt) != i ||
     (i < 0 && !std::numeric_limits<Int>::is_signed)) {
    return false;
  }
  *out = iInt;
  return true;
}

/// ConvertStringToReal converts a string into either float or double
/// and returns false if there was any kind of problem (i.e. the string
/// was not a floating point number or contained extra non-whitespace junk).
/// Be careful- this function will successfully read inf's or nan's.
template <typename T>
bool ConvertStringToReal(const std::string &str,
                         T *out);

/// Removes the beginning and trailing whitespaces from a string
void Trim(std::string *str);

/// Returns true if "str" ends with "suffix".  The comparison is case
/// insensitive when "ignore_case" is true.
bool EndsWith(const std::string &str, const std::string &suffix,
              bool ignore_case = false);

/// Formats a time in seconds the way manifests store it: rounded to the
/// millisecond, trailing zeros removed, but always with at least one digit
/// after the decimal point (e.g. "0.51", "12.0", "3.275").
std::string FormatSeconds(double seconds);

}  // namespace speechseg

#endif  // SPEECHSEG_UTIL_TEXT_UTILS_H_
