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

#include <reshard/Dataset.h>
#include <reshard/ProgressLogger.h>

namespace reshard::utils {

using std::map;
using std::string;

/// Options of the alignment operation.
struct AlignOptions {
  // Video key whose shard coordinates the data & meta/episodes stores will follow.
  // When empty, the dataset's first video key is used.
  string referenceVideoKey;
  // Copy the video shard files to the output dataset. Otherwise, the caller takes care of them.
  bool copyVideos = true;
  // Copy the other files of the source's meta folder (tasks, stats...).
  bool copyMetaFiles = true;
};

/// What the alignment operation did.
struct AlignReport {
  string referenceVideoKey;
  // Number of shards written to the data store (and to the meta/episodes store).
  uint32_t shardCount = 0;
  // For each video key other than the reference, the number of episodes whose coordinate in that
  // key's store differs from their reference coordinate. Only keys with divergences are listed.
  map<string, uint32_t> divergentEpisodeCounts;

  bool hasDivergences() const {
    return !divergentEpisodeCounts.empty();
  }
};

/// Rewrite the data & meta/episodes stores of a dataset so that each episode lives in the same
/// chunk/file coordinate as its reference video. Frame rows, their order and global indexes are
/// unchanged. The new dataset is written in a staging folder, and only published on success.
/// @param source: the dataset to align.
/// @param outputPath: where to publish the aligned dataset. Must not exist.
/// @param options: see AlignOptions.
/// @param outDataset: on success, the aligned dataset, opened.
/// @param outReport: on success, details about the alignment.
/// @param progressLogger: to monitor progress & cancel, or nullptr.
/// @return 0 on success, MISSING_VIDEO_STREAM if an episode has no reference video,
/// SHARD_CONSISTENCY_ERROR if a reference coordinate reappears after another one,
/// OPERATION_CANCELLED, INVALID_PARAMETER if the output path exists, or a read/write error.
int alignShards(
    const DatasetPtr& source,
    const string& outputPath,
    const AlignOptions& options,
    DatasetPtr& outDataset,
    AlignReport& outReport,
    ProgressLogger* progressLogger = nullptr);

} // namespace reshard::utils
