// vad/speech-segmenter.cc

// Copyright 2013  Daniel Povey
//           2026  The speechseg Authors

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

#include "vad/speech-segmenter.h"

#include <algorithm>

namespace speechseg {

void VadOptions::Check() const {
  classifier_opts.Check();
  if (frame_duration != 10 && frame_duration != 20 && frame_duration != 30)
    SPEECHSEG_ERR << "Invalid --frame-duration=" << frame_duration
                  << ", expected 10, 20 or 30";
  if (min_silence_ms < frame_duration)
    SPEECHSEG_ERR << "--min-silence-ms=" << min_silence_ms << " must be at "
                  << "least one frame (" << frame_duration << " ms)";
  if (min_segment_ms < 0)
    SPEECHSEG_ERR << "Invalid --min-segment-ms=" << min_segment_ms;
}

SpeechSegmenter::SpeechSegmenter(const VadOptions &opts):
    frame_duration_ms_(opts.frame_duration),
    min_silence_frames_(opts.MinSilenceFrames()),
    min_tail_sec_(opts.min_segment_ms / 1000.0),
    num_frames_(0), in_speech_(false), segment_start_frame_(-1),
    silence_count_(0), finished_(false) {
  SPEECHSEG_ASSERT(frame_duration_ms_ > 0 && min_silence_frames_ > 0);
}

void SpeechSegmenter::MaybeEmit(double start, double end,
                                double min_duration) {
  SpeechSegment segment(start, end);
  if (segment.duration_sec >= min_duration) {
    segments_.push_back(segment);
    SPEECHSEG_VLOG(2) << "Speech segment " << segment;
  } else {
    SPEECHSEG_VLOG(2) << "Dropping short segment " << segment;
  }
}

void SpeechSegmenter::AcceptFrame(bool is_speech) {
  SPEECHSEG_ASSERT(!finished_);
  int32 t = num_frames_++;
  if (!in_speech_) {
    if (is_speech) {
      in_speech_ = true;
      segment_start_frame_ = t;
      silence_count_ = 0;
    }
    return;
  }
  if (is_speech) {
    silence_count_ = 0;
    return;
  }
  silence_count_++;
  if (silence_count_ >= min_silence_frames_) {
    double start = FrameTime(segment_start_frame_),
        end = FrameTime(t - silence_count_);
    MaybeEmit(start, end, kMinRawSegmentSec);
    in_speech_ = false;
    segment_start_frame_ = -1;
    silence_count_ = 0;
  }
}

void SpeechSegmenter::Finish() {
  if (finished_) return;
  finished_ = true;
  if (in_speech_) {
    double start = FrameTime(segment_start_frame_),
        end = FrameTime(num_frames_);
    MaybeEmit(start, end, std::max(min_tail_sec_, kMinRawSegmentSec));
    in_speech_ = false;
    segment_start_frame_ = -1;
  }
}

void ComputeSpeechSegments(const VadOptions &opts,
                           const std::vector<int16> &samples,
                           FrameClassifier *classifier,
                           SegmentList *segments) {
  SPEECHSEG_ASSERT(classifier != NULL && segments != NULL);
  int32 frame_length = classifier->FrameLength();
  SPEECHSEG_ASSERT(frame_length > 0);
  size_t num_frames = samples.size() / frame_length;
  SpeechSegmenter segmenter(opts);
  int32 num_speech = 0;
  for (size_t f = 0; f < num_frames; f++) {
    bool is_speech = classifier->IsSpeech(&samples[f * frame_length],
                                          frame_length);
    if (is_speech) num_speech++;
    segmenter.AcceptFrame(is_speech);
  }
  segmenter.Finish();
  *segments = segmenter.Segments();
  SPEECHSEG_VLOG(1) << num_speech << " of " << num_frames << " frames are "
                    << "speech; " << segments->size() << " segments.";
}

}  // namespace speechseg
