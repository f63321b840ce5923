// media/manifest.cc

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

#include "media/manifest.h"

#include <errno.h>
#include <stdio.h>

#include <cstring>
#include <fstream>

#include "util/text-utils.h"

namespace speechseg {

const char *kManifestHeader =
    "segment_folder,segment_file,start_sec,end_sec,duration_sec";

std::string ManifestFileName(const std::string &segment_name) {
  return segment_name + "_all.csv";
}

std::string CsvEscape(const std::string &field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos)
    return field;
  std::string ans = "\"";
  for (size_t i = 0; i < field.size(); i++) {
    if (field[i] == '"') ans += '"';
    ans += field[i];
  }
  ans += '"';
  return ans;
}

bool SplitCsvLine(const std::string &line, std::vector<std::string> *fields) {
  fields->clear();
  std::string cur;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cur += '"';
          i++;
        } else {
          quoted = false;
        }
      } else {
        cur += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields->push_back(cur);
      cur.clear();
    } else {
      cur += c;
    }
  }
  if (quoted) return false;
  fields->push_back(cur);
  return true;
}

bool WriteManifest(const std::string &filename,
                   const std::vector<ManifestRow> &rows) {
  std::string tmp_filename = filename + ".tmp";
  {
    std::ofstream os(tmp_filename.c_str());
    if (!os.good()) {
      SPEECHSEG_WARN << "Could not open " << tmp_filename << " for writing";
      return false;
    }
    os << kManifestHeader << '\n';
    for (size_t i = 0; i < rows.size(); i++) {
      const ManifestRow &row = rows[i];
      os << CsvEscape(row.segment_folder) << ','
         << CsvEscape(row.segment_file) << ','
         << FormatSeconds(row.start_sec) << ','
         << FormatSeconds(row.end_sec) << ','
         << FormatSeconds(row.duration_sec) << '\n';
    }
    os.close();
    if (os.fail()) {
      SPEECHSEG_WARN << "Error writing " << tmp_filename;
      remove(tmp_filename.c_str());
      return false;
    }
  }
  if (rename(tmp_filename.c_str(), filename.c_str()) != 0) {
    SPEECHSEG_WARN << "Could not rename " << tmp_filename << " to "
                   << filename << ": " << strerror(errno);
    remove(tmp_filename.c_str());
    return false;
  }
  return true;
}

// Returns the index of "name" in the header, or -1.
static int32 ColumnIndex(const std::vector<std::string> &header,
                         const std::string &name) {
  for (size_t i = 0; i < header.size(); i++)
    if (header[i] == name) return static_cast<int32>(i);
  return -1;
}

bool ReadManifest(const std::string &filename,
                  std::vector<ManifestRow> *rows) {
  rows->clear();
  std::ifstream is(filename.c_str());
  if (!is.good()) {
    SPEECHSEG_WARN << "Could not open manifest " << filename;
    return false;
  }
  std::string line;
  std::vector<std::string> header, fields;
  if (!std::getline(is, line)) {
    SPEECHSEG_WARN << "Manifest " << filename << " is empty";
    return false;
  }
  Trim(&line);
  // Strip a UTF-8 byte order mark, which some spreadsheet programs add.
  if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
  if (!SplitCsvLine(line, &header)) {
    SPEECHSEG_WARN << "Bad header in manifest " << filename;
    return false;
  }
  for (size_t i = 0; i < header.size(); i++) Trim(&header[i]);
  int32 folder_col = ColumnIndex(header, "segment_folder"),
      file_col = ColumnIndex(header, "segment_file"),
      start_col = ColumnIndex(header, "start_sec"),
      end_col = ColumnIndex(header, "end_sec"),
      duration_col = ColumnIndex(header, "duration_sec");
  if (start_col < 0 || end_col < 0) {
    SPEECHSEG_WARN << "Manifest " << filename << " has no start_sec and "
                   << "end_sec columns";
    return false;
  }
  int32 line_number = 1;
  while (std::getline(is, line)) {
    line_number++;
    Trim(&line);
    if (line.empty()) continue;
    if (!SplitCsvLine(line, &fields) ||
        fields.size() != header.size()) {
      SPEECHSEG_WARN << "Bad line " << line_number << " in manifest "
                     << filename << ": " << line;
      return false;
    }
    ManifestRow row;
    if (folder_col >= 0) row.segment_folder = fields[folder_col];
    if (file_col >= 0) row.segment_file = fields[file_col];
    if (!ConvertStringToReal(fields[start_col], &row.start_sec) ||
        !ConvertStringToReal(fields[end_col], &row.end_sec) ||
        (duration_col >= 0 &&
         !ConvertStringToReal(fields[duration_col], &row.duration_sec))) {
      SPEECHSEG_WARN << "Bad number on line " << line_number
                     << " of manifest " << filename << ": " << line;
      return false;
    }
    if (duration_col < 0)
      row.duration_sec = RoundToMillis(row.end_sec - row.start_sec);
    if (row.end_sec <= row.start_sec) {
      SPEECHSEG_WARN << "Empty time range on line " << line_number
                     << " of manifest " << filename;
      return false;
    }
    rows->push_back(row);
  }
  return true;
}

}  // namespace speechseg
