// media/manifest-test.cc

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

#include <cstdlib>
#include <fstream>

#include "media/manifest.h"
#include "util/file-utils.h"

namespace speechseg {

static std::string ReadFile(const std::string &filename) {
  std::ifstream is(filename.c_str());
  std::string ans, line;
  while (std::getline(is, line)) ans += line + "\n";
  return ans;
}

void UnitTestCsvFields() {
  SPEECHSEG_ASSERT(CsvEscape("out/a_segment") == "out/a_segment");
  SPEECHSEG_ASSERT(CsvEscape("a,b") == "\"a,b\"");
  SPEECHSEG_ASSERT(CsvEscape("say \"hi\"") == "\"say \"\"hi\"\"\"");
  std::vector<std::string> fields;
  SPEECHSEG_ASSERT(SplitCsvLine("x,\"a,b\",\"say \"\"hi\"\"\",,1.5",
                                &fields));
  SPEECHSEG_ASSERT(fields.size() == 5);
  SPEECHSEG_ASSERT(fields[0] == "x" && fields[1] == "a,b");
  SPEECHSEG_ASSERT(fields[2] == "say \"hi\"" && fields[3].empty());
  SPEECHSEG_ASSERT(fields[4] == "1.5");
  SPEECHSEG_ASSERT(!SplitCsvLine("\"open,", &fields));
}

void UnitTestWriteRead() {
  char tmpl[] = "/tmp/speechseg-manifest-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl;
  SPEECHSEG_ASSERT(ManifestFileName("segment") == "segment_all.csv");
  std::string filename = JoinPath(dir, ManifestFileName("segment"));

  // Header only.
  std::vector<ManifestRow> rows;
  SPEECHSEG_ASSERT(WriteManifest(filename, rows));
  SPEECHSEG_ASSERT(ReadFile(filename) ==
                   "segment_folder,segment_file,start_sec,end_sec,"
                   "duration_sec\n");
  SPEECHSEG_ASSERT(!FileExists(filename + ".tmp"));
  std::vector<ManifestRow> read_rows(3);
  SPEECHSEG_ASSERT(ReadManifest(filename, &read_rows) && read_rows.empty());

  ManifestRow row;
  row.segment_folder = "out/x_segment";
  row.segment_file = "out/x_segment/segment_1.wav";
  row.start_sec = 0.0;
  row.end_sec = 1.47;
  row.duration_sec = 1.47;
  rows.push_back(row);
  row.segment_file = "out/x_segment/segment_2.wav";
  row.start_sec = 2.7;
  row.end_sec = 3.0;
  row.duration_sec = 0.3;
  rows.push_back(row);
  SPEECHSEG_ASSERT(WriteManifest(filename, rows));
  SPEECHSEG_ASSERT(ReadFile(filename) ==
                   "segment_folder,segment_file,start_sec,end_sec,"
                   "duration_sec\n"
                   "out/x_segment,out/x_segment/segment_1.wav,0.0,1.47,1.47\n"
                   "out/x_segment,out/x_segment/segment_2.wav,2.7,3.0,0.3\n");
  SPEECHSEG_ASSERT(ReadManifest(filename, &read_rows));
  SPEECHSEG_ASSERT(read_rows.size() == 2);
  SPEECHSEG_ASSERT(read_rows[1].segment_file == rows[1].segment_file);
  SPEECHSEG_ASSERT(read_rows[1].start_sec == 2.7 &&
                   read_rows[1].end_sec == 3.0 &&
                   read_rows[1].duration_sec == 0.3);

  // Writing again gives the same bytes.
  std::string before = ReadFile(filename);
  SPEECHSEG_ASSERT(WriteManifest(filename, rows));
  SPEECHSEG_ASSERT(ReadFile(filename) == before);
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

void UnitTestReadOtherCsv() {
  char tmpl[] = "/tmp/speechseg-manifest-XXXXXX";
  SPEECHSEG_ASSERT(mkdtemp(tmpl) != NULL);
  std::string dir = tmpl, filename = JoinPath(dir, "times.csv");
  {
    std::ofstream os(filename.c_str());
    os << "\xEF\xBB\xBF" "end_sec,label,start_sec\r\n"
       << "1.5,\"hello, world\",0.25\r\n"
       << "\r\n"
       << "4,x,3\r\n";
  }
  std::vector<ManifestRow> rows;
  SPEECHSEG_ASSERT(ReadManifest(filename, &rows));
  SPEECHSEG_ASSERT(rows.size() == 2);
  SPEECHSEG_ASSERT(rows[0].start_sec == 0.25 && rows[0].end_sec == 1.5);
  SPEECHSEG_ASSERT(rows[0].duration_sec == 1.25);
  SPEECHSEG_ASSERT(rows[1].duration_sec == 1.0);

  {
    std::ofstream os(filename.c_str());
    os << "start_sec,end_sec\n2.0,1.0\n";
  }
  SPEECHSEG_ASSERT(!ReadManifest(filename, &rows));
  {
    std::ofstream os(filename.c_str());
    os << "begin,finish\n0,1\n";
  }
  SPEECHSEG_ASSERT(!ReadManifest(filename, &rows));
  {
    std::ofstream os(filename.c_str());
    os << "start_sec,end_sec\nzero,1\n";
  }
  SPEECHSEG_ASSERT(!ReadManifest(filename, &rows));
  SPEECHSEG_ASSERT(!ReadManifest(JoinPath(dir, "missing.csv"), &rows));
  SPEECHSEG_ASSERT(RemoveTree(dir));
}

}  // namespace speechseg

int main() {
  using namespace speechseg;
  UnitTestCsvFields();
  UnitTestWriteRead();
  UnitTestReadOtherCsv();
  std::cout << "Test OK.\n";
  return 0;
}
