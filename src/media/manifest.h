// media/manifest.h

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

#ifndef SPEECHSEG_MEDIA_MANIFEST_H_
#define SPEECHSEG_MEDIA_MANIFEST_H_

#include <string>
#include <vector>

#include "base/speechseg-common.h"

namespace speechseg {

/// One line of a segment manifest: a segment file and the time range of the
/// source it was cut from.
struct ManifestRow {
  std::string segment_folder;
  std::string segment_file;
  double start_sec;
  double end_sec;
  double duration_sec;

  ManifestRow(): start_sec(0.0), end_sec(0.0), duration_sec(0.0) { }
};

/// The header line of every manifest, without the newline.
extern const char *kManifestHeader;

/// Name of the manifest file in a segment directory, "{segment_name}_all.csv".
std::string ManifestFileName(const std::string &segment_name);

/// Quotes a CSV field if it contains a comma, a double quote or a line
/// break, doubling any double quotes inside it.
std::string CsvEscape(const std::string &field);

/// Splits one CSV line into fields, undoing CsvEscape().  Returns false if
/// a quoted field is not terminated.
bool SplitCsvLine(const std::string &line, std::vector<std::string> *fields);

/// Writes the header and one line per row.  Times are printed with
/// millisecond precision.  The file is written under a temporary name and
/// renamed into place, so a reader never sees a half-written manifest.
/// Returns false and warns on failure.
bool WriteManifest(const std::string &filename,
                   const std::vector<ManifestRow> &rows);

/// Reads a manifest written by WriteManifest(), or any CSV file with a
/// header that names "start_sec" and "end_sec" columns; the other columns
/// are optional.  A missing duration_sec is computed from the times.
/// Returns false and warns on failure.
bool ReadManifest(const std::string &filename, std::vector<ManifestRow> *rows);

}  // namespace speechseg

#endif  // SPEECHSEG_MEDIA_MANIFEST_H_
