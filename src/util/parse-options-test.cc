// util/parse-options-test.cc

// Copyright 2009-2011  Microsoft Corporation
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

#include <cstdio>
#include <fstream>
#include <unistd.h>

#include "base/speechseg-common.h"
#include "util/parse-options.h"

namespace speechseg {

struct DummyOptions {
  int32 my_int;
  bool my_bool;
  std::string my_string;
  double my_double;

  DummyOptions():
      my_int(0), my_bool(true), my_string("default dummy string"),
      my_double(0.5) { }

  void Register(OptionsItf *opts) {
    opts->Register("my-int", &my_int, "An int32 variable in DummyOptions.");
    opts->Register("my-bool", &my_bool, "A Boolean variable in DummyOptions.");
    opts->Register("my-str", &my_string, "A string variable in DummyOptions.");
    opts->Register("my-double", &my_double, "A double in DummyOptions.");
  }
};

void UnitTestParseOptions() {
  int argc = 8;
  std::string str = "default_for_str";
  int32 num = 1;
  uint32 unum = 2;
  float frac = 0.1;
  const char *argv[8] = { "segment-audio-dir", "--print-args=false", "a",
                          "--num=2", "b", "c", "--unum=3", "--str=xyz" };
  // Options stop at the first positional argument.
  ParseOptions po("my usage msg");
  po.Register("str", &str, "My string");
  po.Register("num", &num, "My int32 variable");
  po.Register("unum", &unum, "My uint32 variable");
  po.Register("frac", &frac, "My float");
  po.Read(argc, argv);
  SPEECHSEG_ASSERT(po.NumArgs() == 6);
  SPEECHSEG_ASSERT(po.GetArg(1) == "a");
  SPEECHSEG_ASSERT(po.GetArg(2) == "--num=2");
  SPEECHSEG_ASSERT(po.GetArg(6) == "--str=xyz");
  SPEECHSEG_ASSERT(po.GetOptArg(7) == "");
  SPEECHSEG_ASSERT(num == 1 && str == "default_for_str");

  const char *argv2[7] = { "segment-audio-dir", "--print-args=false",
                           "--num=2", "--unum=3", "--frac=0.25",
                           "--str=xyz", "a" };
  ParseOptions po2("my usage msg");
  po2.Register("str", &str, "My string");
  po2.Register("num", &num, "My int32 variable");
  po2.Register("unum", &unum, "My uint32 variable");
  po2.Register("frac", &frac, "My float");
  po2.Read(7, argv2);
  SPEECHSEG_ASSERT(po2.NumArgs() == 1);
  SPEECHSEG_ASSERT(num == 2 && unum == 3 && frac == 0.25f && str == "xyz");

  // Underscores and dashes are interchangeable, and "--" ends the options.
  DummyOptions dummy;
  const char *argv3[7] = { "cut-segments", "--print-args=false",
                           "--my_int=7", "--my-bool=false", "--my-str=",
                           "--", "--my-double=2" };
  ParseOptions po3("my usage msg");
  dummy.Register(&po3);
  po3.Read(7, argv3);
  SPEECHSEG_ASSERT(dummy.my_int == 7 && !dummy.my_bool &&
                   dummy.my_string.empty());
  SPEECHSEG_ASSERT(dummy.my_double == 0.5);
  SPEECHSEG_ASSERT(po3.NumArgs() == 1 && po3.GetArg(1) == "--my-double=2");

  // A bare "--my-bool" means true.
  DummyOptions dummy4;
  dummy4.my_bool = false;
  const char *argv4[3] = { "cut-segments", "--print-args=false",
                           "--my-bool" };
  ParseOptions po4("my usage msg");
  dummy4.Register(&po4);
  po4.Read(3, argv4);
  SPEECHSEG_ASSERT(dummy4.my_bool);

  // Unknown options and malformed values are fatal.
  const char *argv5[3] = { "cut-segments", "--print-args=false",
                           "--no-such-option=1" };
  ParseOptions po5("my usage msg");
  DummyOptions dummy5;
  dummy5.Register(&po5);
  bool threw = false;
  try {
    po5.Read(3, argv5);
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);

  const char *argv6[3] = { "cut-segments", "--print-args=false",
                           "--my-int=seven" };
  ParseOptions po6("my usage msg");
  DummyOptions dummy6;
  dummy6.Register(&po6);
  threw = false;
  try {
    po6.Read(3, argv6);
  } catch (const SpeechsegFatalError &e) {
    threw = true;
  }
  SPEECHSEG_ASSERT(threw);
}

void UnitTestConfigFile() {
  char tmpl[] = "/tmp/speechseg-parse-options-XXXXXX";
  int fd = mkstemp(tmpl);
  SPEECHSEG_ASSERT(fd >= 0);
  close(fd);
  std::string filename = tmpl;
  {
    std::ofstream os(filename.c_str());
    os << "# VAD settings\n"
       << "--my-int=30   # frame length\n"
       << "\n"
       << "--my-str=segment\n"
       << "--my-bool=f\n";
  }
  DummyOptions dummy;
  std::string config_arg = "--config=" + filename;
  const char *argv[4] = { "segment-audio-dir", "--print-args=false",
                          config_arg.c_str(), "--my-int=10" };
  ParseOptions po("my usage msg");
  dummy.Register(&po);
  po.Read(4, argv);
  // The command line overrides the config file.
  SPEECHSEG_ASSERT(dummy.my_int == 10);
  SPEECHSEG_ASSERT(dummy.my_string == "segment");
  SPEECHSEG_ASSERT(!dummy.my_bool);
  SPEECHSEG_ASSERT(po.NumArgs() == 0);
  unlink(filename.c_str());
}

void UnitTestEscape() {
  SPEECHSEG_ASSERT(ParseOptions::Escape("abc") == "abc");
  SPEECHSEG_ASSERT(ParseOptions::Escape("a b") == "'a b'");
  SPEECHSEG_ASSERT(ParseOptions::Escape("") == "''");
  SPEECHSEG_ASSERT(ParseOptions::Escape("it's") == "\"it's\"");
  SPEECHSEG_ASSERT(ParseOptions::Escape("/data/x_segment/segment_1.wav") ==
                   "/data/x_segment/segment_1.wav");
}

}  // end namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestParseOptions();
  UnitTestConfigFile();
  UnitTestEscape();
  std::cout << "Parse options tests succeeded.\n";
  return 0;
}
