/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstdint>

#include <map>
#include <string>
#include <vector>

#include <reshard/Coordinates.h>

namespace reshard {

using std::map;
using std::string;
using std::vector;

/// A seek time to hand to a video decoder, and whether the request had to be clamped to the
/// episode's bounds (the frame then repeats a boundary frame, and may be masked as padding).
struct ResolvedSeek {
  SeekTime seekTime;
  bool isPadding{false};

  bool operator==(const ResolvedSeek& rhs) const {
    return seekTime == rhs.seekTime && isPadding == rhs.isPadding;
  }
};

/// \brief Converts episode-relative times, plus frame offsets, into seek times within the video
/// shard files holding each episode.
///
/// For a time t and a frame offset d, the episode-relative instant t + d / fps is clamped to the
/// episode's [0, duration] window, then shifted by the episode's from_timestamp in its video file.
/// Clamping happens before the shift, never in seek time space, so an episode starting in the
/// middle of a video file is never clamped against the file's bounds instead of its own.
///
/// The resolver is immutable and keeps a reference to the episode list, which must outlive it.
/// All methods are const and safe to call from any number of threads.
class TimestampResolver {
 public:
  /// @param fps: the dataset's frame rate.
  /// @param episodes: the dataset's episodes, where episodes[i].episodeIndex == i.
  TimestampResolver(double fps, const vector<EpisodeRecord>& episodes);

  double getFps() const {
    return fps_;
  }

  /// Resolve a single seek time.
  /// @param episodeIndex: the episode.
  /// @param videoKey: the video stream to seek in.
  /// @param time: base episode-relative time, typically the time of the frame requested.
  /// @param frameOffset: offset in frames relative to time. Can be fractional or negative.
  /// @param outSeek: on success, the seek time in the video file holding the episode.
  /// @return 0 on success, EPISODE_NOT_FOUND, MISSING_VIDEO_STREAM or INVALID_TIME_OFFSET.
  int resolve(
      uint32_t episodeIndex,
      const string& videoKey,
      EpisodeTime time,
      double frameOffset,
      ResolvedSeek& outSeek) const;

  /// Resolve seek times for a series of frame offsets, for several video keys at once.
  /// @param videoKeys: the video streams to resolve, or empty for all the episode's streams.
  /// @param outSeeks: on success, for each video key, one resolved seek per frame offset.
  /// @return 0 on success, EPISODE_NOT_FOUND, MISSING_VIDEO_STREAM or INVALID_TIME_OFFSET.
  /// On failure, outSeeks is empty: there are no partial results.
  int resolve(
      uint32_t episodeIndex,
      EpisodeTime time,
      const vector<double>& frameOffsets,
      const vector<string>& videoKeys,
      map<string, vector<ResolvedSeek>>& outSeeks) const;

  /// Same as above, using the time of one of the episode's frames, frameIndex / fps.
  int resolveFrame(
      uint32_t episodeIndex,
      uint32_t frameIndex,
      const vector<double>& frameOffsets,
      const vector<string>& videoKeys,
      map<string, vector<ResolvedSeek>>& outSeeks) const;

  /// Seek times of every frame of an episode, in frame order, for one video key.
  int resolveEpisodeFrames(
      uint32_t episodeIndex,
      const string& videoKey,
      vector<SeekTime>& outSeekTimes) const;

 private:
  int findSpan(uint32_t episodeIndex, const string& videoKey, const VideoSpan*& outSpan) const;
  ResolvedSeek clampAndShift(const VideoSpan& span, double relativeTime) const;

  const double fps_;
  const vector<EpisodeRecord>& episodes_;
};

} // namespace reshard
