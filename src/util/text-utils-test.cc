// util/text-utils-test.cc

// Copyright 2009-2011     Microsoft Corporation
//                2017     Johns Hopkins University (author: Daniel Povey)
//                2026     The speechseg Authors

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
#include "util/text-utils.h"

namespace speechseg {

void TestConvertStringToInteger() {
  int32 i;
  SPEECHSEG_ASSERT(ConvertStringToInteger("12345", &i) && i == 12345);
  SPEECHSEG_ASSERT(ConvertStringToInteger("-3 ", &i) && i == -3);
  SPEECHSEG_ASSERT(!ConvertStringToInteger("", &i));
  SPEECHSEG_ASSERT(!ConvertStringToInteger("a", &i));
  SPEECHSEG_ASSERT(!ConvertStringToInteger("3a", &i));
  SPEECHSEG_ASSERT(!ConvertStringToInteger("1e5", &i));
  SPEECHSEG_ASSERT(!ConvertStringToInteger("99999999999", &i));
  uint32 u;
  SPEECHSEG_ASSERT(!ConvertStringToInteger("-1", &u));
  int8 b;
  SPEECHSEG_ASSERT(!ConvertStringToInteger("300", &b));
}

void TestConvertStringToReal() {
  double d;
  SPEECHSEG_ASSERT(ConvertStringToReal("1", &d) && d == 1.0);
  SPEECHSEG_ASSERT(ConvertStringToReal("-1", &d) && d == -1.0);
  SPEECHSEG_ASSERT(ConvertStringToReal("-1.5 ", &d) && d == -1.5);
  SPEECHSEG_ASSERT(!ConvertStringToReal("", &d));
  SPEECHSEG_ASSERT(!ConvertStringToReal("1.5x", &d));
  float f;
  SPEECHSEG_ASSERT(ConvertStringToReal("0.25", &f) && f == 0.25f);
}

void TestTrim() {
  std::string s = " \t segment_1 \n";
  Trim(&s);
  SPEECHSEG_ASSERT(s == "segment_1");
  s = "   ";
  Trim(&s);
  SPEECHSEG_ASSERT(s.empty());
}

void TestEndsWith() {
  SPEECHSEG_ASSERT(EndsWith("speech.wav", ".wav"));
  SPEECHSEG_ASSERT(!EndsWith("speech.WAV", ".wav"));
  SPEECHSEG_ASSERT(EndsWith("speech.WAV", ".wav", true));
  SPEECHSEG_ASSERT(!EndsWith("wav", ".wav"));
  SPEECHSEG_ASSERT(EndsWith("x_segment", "_segment"));
  SPEECHSEG_ASSERT(EndsWith("anything", ""));
}

void TestFormatSeconds() {
  SPEECHSEG_ASSERT(FormatSeconds(0.0) == "0.0");
  SPEECHSEG_ASSERT(FormatSeconds(-0.0001) == "0.0");
  SPEECHSEG_ASSERT(FormatSeconds(1.47) == "1.47");
  SPEECHSEG_ASSERT(FormatSeconds(2.7) == "2.7");
  SPEECHSEG_ASSERT(FormatSeconds(12.0) == "12.0");
  SPEECHSEG_ASSERT(FormatSeconds(3.2749999) == "3.275");
  SPEECHSEG_ASSERT(FormatSeconds(0.51) == "0.51");
  // 90 * 0.03 accumulates rounding error; the formatted value must not show
  // it.
  double t = 0.0;
  for (int32 i = 0; i < 90; i++) t += 0.03;
  SPEECHSEG_ASSERT(FormatSeconds(t) == "2.7");
}

}  // end namespace speechseg

int main() {
  using namespace speechseg;
  TestConvertStringToInteger();
  TestConvertStringToReal();
  TestTrim();
  TestEndsWith();
  TestFormatSeconds();
  std::cout << "Test OK\n";
}
