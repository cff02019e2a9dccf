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

#include <string>
#include <vector>

#include <reshard/Coordinates.h>
#include <reshard/DatasetInfo.h>

namespace reshard {

using std::string;
using std::vector;

/// Maps shard coordinates to file paths, using the path templates of a dataset's info.json.
/// Templates use {fmt} named arguments: {chunk_index}, {file_index} and {video_key}, with any
/// format specifier, such as "data/chunk-{chunk_index:03d}/file-{file_index:03d}.parquet".
/// Paths are relative to the dataset root.
class DatasetLayout {
 public:
  DatasetLayout() = default;

  /// Create a layout for a dataset, after checking that its templates can be formatted.
  /// @return 0 on success, or INVALID_PATH_TEMPLATE.
  static int create(const DatasetInfo& info, DatasetLayout& outLayout);

  string dataFilePath(const ShardCoordinate& coordinate) const;
  string episodesFilePath(const ShardCoordinate& coordinate) const;
  string videoFilePath(const string& videoKey, const ShardCoordinate& coordinate) const;

  /// Path of a shard of any store: "data", "meta/episodes" or "videos/<key>".
  /// @return The relative path of the shard, or an empty string for an unknown store id.
  string storeFilePath(const string& storeId, const ShardCoordinate& coordinate) const;

  /// List the existing files of a store, using the fixed folder & the extension of its template.
  /// Ex: "data/chunk-{chunk_index:03d}/file-{file_index:03d}.parquet" lists the ".parquet" files
  /// found under "data/", in natural order.
  /// @param datasetRoot: folder of the dataset.
  /// @param pathTemplate: one of the path templates of the dataset.
  /// @param outRelativePaths: paths relative to the dataset root.
  /// @return 0 on success, INVALID_PATH_TEMPLATE, or FILE_NOT_FOUND if the folder is missing.
  static int listStoreFiles(
      const string& datasetRoot,
      const string& pathTemplate,
      vector<string>& outRelativePaths);

 private:
  static bool checkTemplate(const string& pathTemplate, bool needsVideoKey);

  string dataPath_{DatasetInfo::kDefaultDataPath};
  string videoPath_{DatasetInfo::kDefaultVideoPath};
  string episodesPath_{DatasetInfo::kDefaultEpisodesPath};
};

} // namespace reshard
