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

namespace reshard::utils {

using std::string;
using std::vector;

/// How a derived dataset relates to its source.
enum class DerivedType {
  Aligned, ///< same episodes, in the same order
  Shuffled, ///< same episodes, in a different order
};

struct ValidationOptions {
  DerivedType derivedType = DerivedType::Aligned;
  // Video key the data & meta/episodes coordinates should match. Empty means the first video key.
  string referenceVideoKey;
  // Check that each episode's data, meta/episodes & reference video coordinates are the same.
  bool checkAlignment = true;
  // Decode the video frames of a few sample frames.
  bool decodeSampleFrames = true;
  // Number of leading episodes whose tasks should differ in order after a shuffle.
  uint32_t shuffleCheckEpisodeCount = 10;
};

/// Results of the checks. Failures are human readable descriptions of the problems found.
struct ValidationReport {
  uint32_t checkCount = 0;
  vector<string> failures;
  vector<string> warnings;

  bool isValid() const {
    return failures.empty();
  }
};

/// XXH64 digest of the content of an episode's frame rows: their frame index, timestamp,
/// task & features, but not their global & episode indexes, which a shuffle changes.
/// @return 0 on success, or a read error.
int episodeContentDigest(const Dataset& dataset, uint32_t episodeIndex, string& outDigest);

/// Check that a dataset derived from another one by alignment or shuffling has the same content,
/// and that its shards are consistent.
/// @param source: the original dataset.
/// @param derived: the aligned or shuffled dataset.
/// @param options: what to check.
/// @param outReport: the results of the checks.
/// @param progressLogger: to monitor progress & cancel, or nullptr.
/// @return 0 if the checks could be performed, whatever their results, OPERATION_CANCELLED,
/// or a read error.
int validateDerivedDataset(
    const DatasetPtr& source,
    const DatasetPtr& derived,
    const ValidationOptions& options,
    ValidationReport& outReport,
    ProgressLogger* progressLogger = nullptr);

} // namespace reshard::utils
