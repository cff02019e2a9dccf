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

#include <reshard/Dataset.h>
#include <reshard/VideoCodec.h>

namespace reshard::utils {

using std::map;
using std::string;
using std::vector;

/// A training sample: one frame row, and for each video key, the frames decoded at the requested
/// frame offsets around it.
struct FrameSample {
  FrameRecord frame;
  /// Frame offsets requested, in frames, relative to the frame's time.
  vector<double> deltas;
  /// For each video key, one decoded frame per delta.
  map<string, vector<VideoFrame>> videoFrames;
  /// For each video key, one flag per delta, set when the delta fell outside of the episode and
  /// the frame was clamped to the episode's first or last frame.
  map<string, vector<bool>> isPadding;

  void clear() {
    frame = {};
    deltas.clear();
    videoFrames.clear();
    isPadding.clear();
  }
};

/// \brief Random access to the frames of a dataset, by global index or by (episode, frame) pair.
///
/// Rows are found through the dataset's shard manifest, video frames through its timestamp
/// resolver. A frame reader only reads immutable data, and may be used by any number of threads.
class FrameReader {
 public:
  explicit FrameReader(DatasetPtr dataset);

  const Dataset& getDataset() const {
    return *dataset_;
  }

  /// Read a sample by global index.
  /// @param index: the global index of the frame.
  /// @param deltas: frame offsets of the video frames to decode. Can be empty.
  /// @param outSample: on success, the frame & its video frames.
  /// @param videoKeys: the video streams to decode, or empty for all the episode's streams.
  /// @return 0 on success, FRAME_NOT_FOUND, a shard, read or decode error.
  int readFrame(
      GlobalIndex index,
      const vector<double>& deltas,
      FrameSample& outSample,
      const vector<string>& videoKeys = {}) const;

  /// Read a sample by episode & frame index within the episode.
  /// @return 0 on success, EPISODE_NOT_FOUND, FRAME_NOT_FOUND, a shard, read or decode error.
  int readEpisodeFrame(
      uint32_t episodeIndex,
      uint32_t frameIndex,
      const vector<double>& deltas,
      FrameSample& outSample,
      const vector<string>& videoKeys = {}) const;

  /// Read a frame row only.
  int readFrameRow(GlobalIndex index, FrameRecord& outFrame) const;

 private:
  int decodeVideoFrames(
      const EpisodeRecord& episode,
      uint32_t frameIndex,
      const vector<string>& videoKeys,
      FrameSample& outSample) const;

  DatasetPtr dataset_;
};

} // namespace reshard::utils
