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

#include <reshard/TimestampResolver.h>

#include <algorithm>
#include <cmath>

#define DEFAULT_LOG_CHANNEL "TimestampResolver"
#include <logging/Checks.h>
#include <logging/Log.h>

#include <reshard/ErrorCode.h>

using namespace std;

namespace {

// Tolerance for float errors when deciding if a request was clamped
const double kPaddingEpsilon = 1e-9;

} // namespace

namespace reshard {

TimestampResolver::TimestampResolver(double fps, const vector<EpisodeRecord>& episodes)
    : fps_{fps}, episodes_{episodes} {
  RS_CHECK_GT(fps_, 0);
}

int TimestampResolver::findSpan(
    uint32_t episodeIndex,
    const string& videoKey,
    const VideoSpan*& outSpan) const {
  outSpan = nullptr;
  if (episodeIndex >= episodes_.size()) {
    RS_LOGE("Episode {} not found, {} episodes available.", episodeIndex, episodes_.size());
    return EPISODE_NOT_FOUND;
  }
  outSpan = episodes_[episodeIndex].findVideo(videoKey);
  if (outSpan == nullptr) {
    RS_LOGE("Episode {} has no '{}' video stream.", episodeIndex, videoKey);
    return MISSING_VIDEO_STREAM;
  }
  return SUCCESS;
}

ResolvedSeek TimestampResolver::clampAndShift(const VideoSpan& span, double relativeTime) const {
  const double duration = max<double>(span.duration(), 0);
  ResolvedSeek seek;
  seek.isPadding =
      relativeTime < -kPaddingEpsilon || relativeTime > duration + kPaddingEpsilon;
  if (duration > 0 && relativeTime >= duration) {
    // from + (to - from) may be one ulp away from to
    seek.seekTime = span.toTimestamp;
  } else {
    EpisodeTime clamped(max<double>(min<double>(relativeTime, duration), 0));
    seek.seekTime = toSeekTime(clamped, span);
  }
  return seek;
}

int TimestampResolver::resolve(
    uint32_t episodeIndex,
    const string& videoKey,
    EpisodeTime time,
    double frameOffset,
    ResolvedSeek& outSeek) const {
  if (!isfinite(time.seconds()) || !isfinite(frameOffset)) {
    RS_LOGE("Invalid time request: {}s, offset {}", time.seconds(), frameOffset);
    return INVALID_TIME_OFFSET;
  }
  const VideoSpan* span = nullptr;
  int status = findSpan(episodeIndex, videoKey, span);
  if (status != 0) {
    return status;
  }
  outSeek = clampAndShift(*span, time.seconds() + frameOffset / fps_);
  return SUCCESS;
}

int TimestampResolver::resolve(
    uint32_t episodeIndex,
    EpisodeTime time,
    const vector<double>& frameOffsets,
    const vector<string>& videoKeys,
    map<string, vector<ResolvedSeek>>& outSeeks) const {
  outSeeks.clear();
  if (!isfinite(time.seconds())) {
    RS_LOGE("Invalid episode time: {}", time.seconds());
    return INVALID_TIME_OFFSET;
  }
  for (double offset : frameOffsets) {
    if (!isfinite(offset)) {
      RS_LOGE("Invalid frame offset: {}", offset);
      return INVALID_TIME_OFFSET;
    }
  }
  if (episodeIndex >= episodes_.size()) {
    RS_LOGE("Episode {} not found, {} episodes available.", episodeIndex, episodes_.size());
    return EPISODE_NOT_FOUND;
  }
  const EpisodeRecord& episode = episodes_[episodeIndex];
  vector<string> allKeys;
  if (videoKeys.empty()) {
    for (const auto& video : episode.videos) {
      allKeys.push_back(video.first);
    }
  }
  for (const string& videoKey : videoKeys.empty() ? allKeys : videoKeys) {
    const VideoSpan* span = nullptr;
    int status = findSpan(episodeIndex, videoKey, span);
    if (status != 0) {
      outSeeks.clear();
      return status;
    }
    vector<ResolvedSeek>& seeks = outSeeks[videoKey];
    seeks.reserve(frameOffsets.size());
    for (double offset : frameOffsets) {
      seeks.push_back(clampAndShift(*span, time.seconds() + offset / fps_));
    }
  }
  return SUCCESS;
}

int TimestampResolver::resolveFrame(
    uint32_t episodeIndex,
    uint32_t frameIndex,
    const vector<double>& frameOffsets,
    const vector<string>& videoKeys,
    map<string, vector<ResolvedSeek>>& outSeeks) const {
  return resolve(
      episodeIndex,
      EpisodeTime::fromFrameIndex(frameIndex, fps_),
      frameOffsets,
      videoKeys,
      outSeeks);
}

int TimestampResolver::resolveEpisodeFrames(
    uint32_t episodeIndex,
    const string& videoKey,
    vector<SeekTime>& outSeekTimes) const {
  outSeekTimes.clear();
  const VideoSpan* span = nullptr;
  int status = findSpan(episodeIndex, videoKey, span);
  if (status != 0) {
    return status;
  }
  const uint32_t length = episodes_[episodeIndex].length;
  outSeekTimes.reserve(length);
  for (uint32_t frameIndex = 0; frameIndex < length; frameIndex++) {
    double relativeTime = EpisodeTime::fromFrameIndex(frameIndex, fps_).seconds();
    outSeekTimes.push_back(clampAndShift(*span, relativeTime).seekTime);
  }
  return SUCCESS;
}

} // namespace reshard
