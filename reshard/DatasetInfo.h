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

#include <reshard/Coordinates.h>

namespace reshard {

using std::string;
using std::vector;

/// Description of one column or stream of the dataset, as found in the "features" of info.json.
struct FeatureInfo {
  static constexpr const char* kVideoDtype = "video";

  string name;
  string dtype; // "float32", "int64", "video"...
  vector<uint32_t> shape;

  bool isVideo() const {
    return dtype == kVideoDtype;
  }

  bool operator==(const FeatureInfo& rhs) const {
    return name == rhs.name && dtype == rhs.dtype && shape == rhs.shape;
  }
};

/// Dataset-level summary, persisted as meta/info.json.
struct DatasetInfo {
  static constexpr const char* kInfoJsonPath = "meta/info.json";

  static constexpr const char* kDefaultDataPath =
      "data/chunk-{chunk_index:03d}/file-{file_index:03d}.parquet";
  static constexpr const char* kDefaultVideoPath =
      "videos/chunk-{chunk_index:03d}/{video_key}/file-{file_index:03d}.mp4";
  static constexpr const char* kDefaultEpisodesPath =
      "meta/episodes/chunk-{chunk_index:03d}/file-{file_index:03d}.parquet";

  string codebaseVersion{"v3.0"};
  string robotType;
  double fps{0};
  uint32_t totalEpisodes{0};
  uint64_t totalFrames{0};
  uint32_t totalTasks{0};
  uint32_t chunksSize{ShardCoordinate::kDefaultChunksSize};
  double dataFilesSizeInMb{100};
  double videoFilesSizeInMb{500};
  /// In declaration order, which is meaningful: the first video feature is the default
  /// reference video key.
  vector<FeatureInfo> features;
  string dataPath{kDefaultDataPath};
  string videoPath{kDefaultVideoPath};
  string episodesPath{kDefaultEpisodesPath};
  /// Optional explicit list of the tabular shard files, relative to the dataset root.
  vector<string> dataFiles;

  /// Names of the video features, in declaration order.
  vector<string> getVideoKeys() const;
  const FeatureInfo* findFeature(const string& name) const;

  /// Parse the json text of an info.json file.
  /// @return 0 on success, INVALID_DATASET_INFO if the json is invalid or fields are missing.
  int fromJson(const string& jsonText);
  string toJson() const;

  /// Read/write <datasetRoot>/meta/info.json
  int readFromDataset(const string& datasetRoot);
  int writeToDataset(const string& datasetRoot) const;
};

} // namespace reshard
