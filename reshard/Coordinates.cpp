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

#include <reshard/Coordinates.h>

#include <string_view>

#include <fmt/format.h>

#include <logging/Checks.h>

#include <reshard/helpers/Strings.h>

using namespace std;

namespace reshard {

uint64_t GlobalIndex::distanceFrom(GlobalIndex start) const {
  RS_CHECK_GE(value_, start.value_);
  return value_ - start.value_;
}

EpisodeTime EpisodeTime::fromFrameIndex(uint32_t frameIndex, double fps) {
  RS_CHECK_GT(fps, 0);
  return EpisodeTime(frameIndex / fps);
}

ShardCoordinate ShardCoordinate::next(uint32_t chunksSize) const {
  if (chunksSize == 0) {
    chunksSize = kDefaultChunksSize;
  }
  if (fileIndex + 1 >= chunksSize) {
    return {chunkIndex + 1, 0};
  }
  return {chunkIndex, fileIndex + 1};
}

string ShardCoordinate::toString() const {
  return fmt::format("chunk-{:03d}/file-{:03d}", chunkIndex, fileIndex);
}

SeekTime toSeekTime(EpisodeTime time, const VideoSpan& span) {
  return SeekTime(span.fromTimestamp.seconds() + time.seconds());
}

const VideoSpan* EpisodeRecord::findVideo(const string& videoKey) const {
  auto iter = videos.find(videoKey);
  return iter != videos.end() ? &iter->second : nullptr;
}

bool EpisodeRecord::operator==(const EpisodeRecord& rhs) const {
  return episodeIndex == rhs.episodeIndex && datasetFromIndex == rhs.datasetFromIndex &&
      datasetToIndex == rhs.datasetToIndex && length == rhs.length && tasks == rhs.tasks &&
      dataCoordinate == rhs.dataCoordinate && metaCoordinate == rhs.metaCoordinate &&
      videos == rhs.videos;
}

bool FrameRecord::operator==(const FrameRecord& rhs) const {
  return index == rhs.index && episodeIndex == rhs.episodeIndex &&
      frameIndex == rhs.frameIndex && timestamp == rhs.timestamp &&
      taskIndex == rhs.taskIndex && features == rhs.features;
}

string videoStoreId(const string& videoKey) {
  return kVideoStorePrefix + videoKey;
}

bool isVideoStoreId(const string& storeId, string& outVideoKey) {
  const string_view prefix{kVideoStorePrefix};
  if (storeId.size() > prefix.size() && helpers::startsWith(storeId, prefix)) {
    outVideoKey = storeId.substr(prefix.size());
    return true;
  }
  outVideoKey.clear();
  return false;
}

} // namespace reshard
