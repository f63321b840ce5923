// media/segment-cutter.cc

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

#include "media/segment-cutter.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "util/file-utils.h"
#include "util/text-utils.h"

namespace speechseg {

void CutterOptions::Check() const {
  if (segment_name.empty() ||
      segment_name.find('/') != std::string::npos)
    SPEECHSEG_ERR << "Invalid --segment-name='" << segment_name << "'";
  if (file_format.empty() || file_format[0] == '.' ||
      file_format.find('/') != std::string::npos)
    SPEECHSEG_ERR << "Invalid --file-format='" << file_format
                  << "', expected an extension such as wav";
  if (batch_size <= 0)
    SPEECHSEG_ERR << "Invalid --batch-size=" << batch_size;
}

SegmentCutter::SegmentCutter(const CutterOptions &opts,
                             MediaBackend *backend):
    opts_(opts), backend_(backend) {
  opts_.Check();
  SPEECHSEG_ASSERT(backend_ != NULL);
}

std::string SegmentCutter::SegmentFolder(const std::string &dest_dir,
                                         size_t index) const {
  if (!opts_.segment_subfolders) return dest_dir;
  std::ostringstream os;
  os << "segment_" << (index + 1);
  return JoinPath(dest_dir, os.str());
}

std::string SegmentCutter::SegmentFile(const std::string &dest_dir,
                                       size_t index) const {
  std::ostringstream os;
  os << opts_.segment_name << '_' << (index + 1) << '.' << opts_.file_format;
  return JoinPath(SegmentFolder(dest_dir, index), os.str());
}

// True if "name" is "{prefix}{n}{suffix}" for a positive decimal n.
static bool IsNumberedName(const std::string &name, const std::string &prefix,
                           const std::string &suffix) {
  if (name.size() <= prefix.size() + suffix.size() ||
      name.compare(0, prefix.size(), prefix) != 0 ||
      !EndsWith(name, suffix))
    return false;
  for (size_t i = prefix.size(); i < name.size() - suffix.size(); i++)
    if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
  return true;
}

bool SegmentCutter::RemoveStaleOutputs(const std::string &dest_dir) const {
  std::string manifest = JoinPath(dest_dir,
                                  ManifestFileName(opts_.segment_name));
  if (!RemoveTree(manifest) || !RemoveTree(manifest + ".tmp")) {
    SPEECHSEG_WARN << "Could not remove old manifest " << manifest;
    return false;
  }
  std::vector<std::string> names;
  if (!ListDirectory(dest_dir, &names)) return false;
  std::string file_prefix = opts_.segment_name + "_",
      file_suffix = "." + opts_.file_format;
  for (size_t i = 0; i < names.size(); i++) {
    std::string path = JoinPath(dest_dir, names[i]);
    bool stale = IsNumberedName(names[i], file_prefix, file_suffix) ||
        (IsDirectory(path) && IsNumberedName(names[i], "segment_", ""));
    if (stale && !RemoveTree(path)) {
      SPEECHSEG_WARN << "Could not remove old segment " << path;
      return false;
    }
  }
  return true;
}

bool SegmentCutter::CutOne(const std::string &source,
                           const ExtractRange &range) const {
  MediaError error;
  if (backend_->Extract(source, range, &error) && FileExists(range.output)) {
    SPEECHSEG_VLOG(2) << "Cut " << FormatSeconds(range.start_sec) << " to "
                      << FormatSeconds(range.end_sec) << " s of " << source
                      << " -> " << range.output;
    return true;
  }
  SPEECHSEG_WARN << "Could not cut " << FormatSeconds(range.start_sec)
                 << " to " << FormatSeconds(range.end_sec) << " s of "
                 << source << " to " << range.output << ": "
                 << error.ToString();
  RemoveTree(range.output);
  return false;
}

void SegmentCutter::CutBatch(const std::string &source,
                             const std::vector<ExtractRange> &ranges,
                             size_t begin, size_t end,
                             std::vector<bool> *written,
                             CutStats *stats) const {
  if (backend_->SupportsBatchExtract() && end - begin > 1) {
    std::vector<ExtractRange> batch(ranges.begin() + begin,
                                    ranges.begin() + end);
    MediaError error;
    if (backend_->ExtractBatch(source, batch, &error)) {
      // Retry anything the tool claims to have written but did not.
      for (size_t i = begin; i < end; i++)
        (*written)[i] = FileExists(ranges[i].output) ||
            CutOne(source, ranges[i]);
      return;
    }
    stats->num_batch_failures++;
    SPEECHSEG_WARN << "Cutting segments " << (begin + 1) << " to " << end
                   << " of " << source << " in one call failed ("
                   << error.ToString() << "); cutting them one at a time";
    for (size_t i = begin; i < end; i++)
      RemoveTree(ranges[i].output);
  }
  for (size_t i = begin; i < end; i++)
    (*written)[i] = CutOne(source, ranges[i]);
}

bool SegmentCutter::Cut(const std::string &source,
                        const std::string &dest_dir,
                        const SegmentList &segments,
                        const CancellationToken *cancel,
                        CutStats *stats) const {
  CutStats local_stats;
  if (stats == NULL) stats = &local_stats;
  *stats = CutStats();
  stats->num_requested = segments.size();

  if (!CreateDirectories(dest_dir)) {
    SPEECHSEG_WARN << "Could not create output directory " << dest_dir;
    return false;
  }

  // Remove everything an earlier run left, the manifest first, so that a
  // manifest in dest_dir always describes files written by one run, and a
  // segment file that exists afterwards was written by this one.
  if (!RemoveStaleOutputs(dest_dir)) return false;

  std::vector<ExtractRange> ranges;
  ranges.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); i++) {
    std::string folder = SegmentFolder(dest_dir, i);
    if (opts_.segment_subfolders && !CreateDirectories(folder)) {
      SPEECHSEG_WARN << "Could not create segment folder " << folder;
      return false;
    }
    ranges.push_back(ExtractRange(segments[i].start_sec, segments[i].end_sec,
                                  SegmentFile(dest_dir, i)));
  }

  std::vector<bool> written(ranges.size(), false);
  size_t batch_size = opts_.batch_size;
  // The token is checked once more after the last batch: a range of that
  // batch may have failed because of the interruption.
  for (size_t begin = 0; ; begin += batch_size) {
    if (cancel != NULL && cancel->IsCancelled()) {
      SPEECHSEG_WARN << "Cancelled while cutting " << source
                     << "; not writing its manifest";
      return false;
    }
    if (begin >= ranges.size()) break;
    size_t end = std::min(ranges.size(), begin + batch_size);
    CutBatch(source, ranges, begin, end, &written, stats);
  }

  std::vector<ManifestRow> rows;
  for (size_t i = 0; i < ranges.size(); i++) {
    if (!written[i]) {
      stats->num_failed++;
      if (opts_.segment_subfolders)
        RemoveTree(SegmentFolder(dest_dir, i));
      continue;
    }
    ManifestRow row;
    row.segment_folder = SegmentFolder(dest_dir, i);
    row.segment_file = ranges[i].output;
    row.start_sec = segments[i].start_sec;
    row.end_sec = segments[i].end_sec;
    row.duration_sec = segments[i].duration_sec;
    rows.push_back(row);
    stats->num_written++;
  }

  std::string manifest = JoinPath(dest_dir,
                                  ManifestFileName(opts_.segment_name));
  if (!WriteManifest(manifest, rows))
    return false;
  if (stats->num_failed > 0)
    SPEECHSEG_WARN << "Exported " << stats->num_written << " of "
                   << stats->num_requested << " segments of " << source
                   << " -> " << dest_dir;
  else
    SPEECHSEG_VLOG(1) << "Exported " << stats->num_written << " segments of "
                      << source << " -> " << dest_dir;
  return true;
}

}  // namespace speechseg
