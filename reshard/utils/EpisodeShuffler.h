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

#include <string>
#include <vector>

#include <reshard/Dataset.h>
#include <reshard/ProgressLogger.h>
#include <reshard/VideoCodec.h>

namespace reshard::utils {

using std::string;
using std::vector;

/// Options of the shuffle operation.
struct ShuffleOptions {
  // Max number of frames per output shard file. Episodes are never split, so a single episode
  // longer than that gets a shard of its own. When 0, derived from targetFileDurationSec.
  uint32_t maxFramesPerFile = 0;
  // Target duration of the output shard files, in seconds, when maxFramesPerFile is 0.
  double targetFileDurationSec = 600;
  // Number of threads re-encoding the videos. 0 means the hardware concurrency.
  unsigned workerThreadCount = 0;
  // Encoder settings of the new video shard files. The frame rate is always the dataset's.
  VideoEncodeSettings encodeSettings;
  // Copy the other files of the source's meta folder (tasks, stats...).
  bool copyMetaFiles = true;

  /// Max number of frames per output shard, for a dataset's frame rate. Never less than 1.
  uint32_t getMaxFramesPerFile(double fps) const;
};

/// Deterministic permutation of [0, count), the same on every platform for the same seed.
/// Uses a 64 bit Mersenne Twister and a Fisher-Yates shuffle, with rejection sampling.
vector<uint32_t> makeEpisodePermutation(uint32_t count, uint64_t seed);

/// Create a copy of a dataset with its episodes in a random order.
/// New episode i is the source's episode permutation[i]. Episode and global indexes are
/// renumbered densely, and the episodes are packed in new shards, identical for all the stores,
/// which requires re-encoding every video. The new dataset is written in a staging folder, and
/// only published on success.
/// A dataset with less than 2 episodes is returned as is, and nothing is written.
/// @param source: the dataset to shuffle.
/// @param seed: seed of the permutation.
/// @param outputPath: where to publish the shuffled dataset. Must not exist.
/// @param options: see ShuffleOptions.
/// @param outDataset: on success, the shuffled dataset, opened.
/// @param progressLogger: to monitor progress & cancel, or nullptr.
/// @return 0 on success, OPERATION_CANCELLED, INVALID_PARAMETER if the output path exists,
/// a media codec error, or a read/write error.
int shuffleEpisodes(
    const DatasetPtr& source,
    uint64_t seed,
    const string& outputPath,
    const ShuffleOptions& options,
    DatasetPtr& outDataset,
    ProgressLogger* progressLogger = nullptr);

} // namespace reshard::utils
