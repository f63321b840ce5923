// util/text-utils.cc

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

#include "util/text-utils.h"

#include <cctype>
#include <cmath>
#include <cstdio>

#include "base/speechseg-common.h"

namespace speechseg {

template <typename T>
bool ConvertStringToReal(const std::string &str,
                         T *out) {
  const char *this_str = str.c_str();
  char *end = NULL;
  errno = 0;
  double d = strtod(this_str, &end);
  if (end != this_str)
    while (isspace(*end)) end++;
  if (end == this_str || *end != '\0' || errno != 0)
    return false;
  *out = static_cast<T>(d);
  return true;
}

// instantiate the templates
template
bool ConvertStringToReal(const std::string &str,
                         double *out);

template
bool ConvertStringToReal(const std::string &str,
                         float *out);

void Trim(std::string *str) {
  const char *white_chars = " \t\n\r\f\v";

  std::string::size_type pos = str->find_last_not_of(white_chars);
  if (pos != std::string::npos)  {
    str->erase(pos + 1);
    pos = str->find_first_not_of(white_chars);
    if (pos != std::string::npos) str->erase(0, pos);
  } else {
    str->erase(str->begin(), str->end());
  }
}

bool EndsWith(const std::string &str, const std::string &suffix,
              bool ignore_case) {
  if (suffix.size() > str.size()) return false;
  size_t offset = str.size() - suffix.size();
  for (size_t i = 0; i < suffix.size(); i++) {
    char a = str[offset + i], b = suffix[i];
    if (ignore_case) {
      a = std::tolower(static_cast<unsigned char>(a));
      b = std::tolower(static_cast<unsigned char>(b));
    }
    if (a != b) return false;
  }
  return true;
}

std::string FormatSeconds(double seconds) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.3f", RoundToMillis(seconds));
  std::string ans(buf);
  // "%.3f" always leaves three decimals; strip down to at least one.
  size_t dot = ans.find('.');
  if (dot == std::string::npos) return ans;
  size_t last = ans.size() - 1;
  while (last > dot + 1 && ans[last] == '0') last--;
  ans.erase(last + 1);
  if (ans == "-0.0") ans = "0.0";
  return ans;
}

}  // end namespace speechseg
