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

namespace reshard {

using std::map;
using std::string;
using std::vector;

/// Dataset-wide frame counter. Strictly increasing over the whole dataset, it never resets at
/// shard or episode boundaries. Arithmetic with plain integers is only possible through named
/// methods, so that an index is never confused with a time or a row number.
class GlobalIndex {
 public:
  constexpr GlobalIndex() = default;
  constexpr explicit GlobalIndex(uint64_t value) : value_{value} {}

  constexpr uint64_t value() const {
    return value_;
  }
  /// Index of the frame count-th frames after this one.
  constexpr GlobalIndex advancedBy(uint64_t count) const {
    return GlobalIndex(value_ + count);
  }
  /// Number of frames from start to this index. start may not be after this index.
  uint64_t distanceFrom(GlobalIndex start) const;

  constexpr bool operator==(GlobalIndex rhs) const {
    return value_ == rhs.value_;
  }
  constexpr bool operator!=(GlobalIndex rhs) const {
    return value_ != rhs.value_;
  }
  constexpr bool operator<(GlobalIndex rhs) const {
    return value_ < rhs.value_;
  }
  constexpr bool operator<=(GlobalIndex rhs) const {
    return value_ <= rhs.value_;
  }
  constexpr bool operator>(GlobalIndex rhs) const {
    return value_ > rhs.value_;
  }
  constexpr bool operator>=(GlobalIndex rhs) const {
    return value_ >= rhs.value_;
  }

 private:
  uint64_t value_{0};
};

/// Seconds since the first frame of an episode. Resets every episode.
/// Never a position in a video file: see SeekTime.
class EpisodeTime {
 public:
  constexpr EpisodeTime() = default;
  constexpr explicit EpisodeTime(double seconds) : seconds_{seconds} {}

  /// Time of the frame frameIndex of an episode recorded at fps frames per second.
  static EpisodeTime fromFrameIndex(uint32_t frameIndex, double fps);

  constexpr double seconds() const {
    return seconds_;
  }

  constexpr bool operator==(EpisodeTime rhs) const {
    return seconds_ == rhs.seconds_;
  }
  constexpr bool operator!=(EpisodeTime rhs) const {
    return seconds_ != rhs.seconds_;
  }
  constexpr bool operator<(EpisodeTime rhs) const {
    return seconds_ < rhs.seconds_;
  }

 private:
  double seconds_{0};
};

/// Seconds from the start of one specific video shard file.
/// This is what a video decoder needs to find a frame.
class SeekTime {
 public:
  constexpr SeekTime() = default;
  constexpr explicit SeekTime(double seconds) : seconds_{seconds} {}

  constexpr double seconds() const {
    return seconds_;
  }

  constexpr bool operator==(SeekTime rhs) const {
    return seconds_ == rhs.seconds_;
  }
  constexpr bool operator!=(SeekTime rhs) const {
    return seconds_ != rhs.seconds_;
  }
  constexpr bool operator<(SeekTime rhs) const {
    return seconds_ < rhs.seconds_;
  }

 private:
  double seconds_{0};
};

/// Address of one physical shard within one store. Ordered lexicographically.
struct ShardCoordinate {
  static constexpr uint32_t kDefaultChunksSize = 1000;

  constexpr ShardCoordinate() = default;
  constexpr ShardCoordinate(uint32_t chunk, uint32_t file) : chunkIndex{chunk}, fileIndex{file} {}

  /// Coordinate of the shard following this one: the next file of the same chunk,
  /// or the first file of the next chunk when chunksSize files are in the chunk already.
  ShardCoordinate next(uint32_t chunksSize = kDefaultChunksSize) const;

  /// "chunk-003/file-012", for logs
  string toString() const;

  constexpr bool operator==(const ShardCoordinate& rhs) const {
    return chunkIndex == rhs.chunkIndex && fileIndex == rhs.fileIndex;
  }
  constexpr bool operator!=(const ShardCoordinate& rhs) const {
    return !operator==(rhs);
  }
  constexpr bool operator<(const ShardCoordinate& rhs) const {
    return chunkIndex < rhs.chunkIndex ||
        (chunkIndex == rhs.chunkIndex && fileIndex < rhs.fileIndex);
  }

  uint32_t chunkIndex{0};
  uint32_t fileIndex{0};
};

/// Where an episode lives in the video store of one video key: the shard, and the window of seek
/// times the episode's frames occupy in that file.
/// toTimestamp - fromTimestamp is the episode's duration, which doesn't depend on the shard.
struct VideoSpan {
  ShardCoordinate coordinate;
  SeekTime fromTimestamp;
  SeekTime toTimestamp;

  double duration() const {
    return toTimestamp.seconds() - fromTimestamp.seconds();
  }

  bool operator==(const VideoSpan& rhs) const {
    return coordinate == rhs.coordinate && fromTimestamp == rhs.fromTimestamp &&
        toTimestamp == rhs.toTimestamp;
  }
};

/// The one conversion from episode time to seek time: shift by the episode's start in the file.
/// No clamping is performed here.
SeekTime toSeekTime(EpisodeTime time, const VideoSpan& span);

/// Per episode boundary record, as found in the meta/episodes store.
struct EpisodeRecord {
  uint32_t episodeIndex{0};
  /// Half-open range of global indexes owned by this episode.
  GlobalIndex datasetFromIndex;
  GlobalIndex datasetToIndex;
  /// Frame count. Always datasetToIndex - datasetFromIndex in a consistent dataset.
  uint32_t length{0};
  vector<string> tasks;
  ShardCoordinate dataCoordinate;
  ShardCoordinate metaCoordinate;
  map<string, VideoSpan> videos; // by video key

  /// @return The episode's span for a video key, or nullptr if the episode has no such stream.
  const VideoSpan* findVideo(const string& videoKey) const;

  bool containsIndex(GlobalIndex index) const {
    return index >= datasetFromIndex && index < datasetToIndex;
  }

  bool operator==(const EpisodeRecord& rhs) const;
};

/// One row of the tabular store.
struct FrameRecord {
  GlobalIndex index;
  uint32_t episodeIndex{0};
  /// 0-based, resets every episode
  uint32_t frameIndex{0};
  /// frameIndex / fps
  EpisodeTime timestamp;
  int64_t taskIndex{0};
  /// Other numeric columns, such as "action" or "observation.state"
  map<string, vector<float>> features;

  bool operator==(const FrameRecord& rhs) const;
};

/// Store identifiers, as used by the shard manifest.
constexpr const char* kDataStore = "data";
constexpr const char* kEpisodesStore = "meta/episodes";
constexpr const char* kVideoStorePrefix = "videos/";

/// "videos/<videoKey>"
string videoStoreId(const string& videoKey);
/// Tell if a store id is a video store id, and if so, extract its video key.
bool isVideoStoreId(const string& storeId, string& outVideoKey);

} // namespace reshard
