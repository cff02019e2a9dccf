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

#include <reshard/BackendFactory.h>
#include <reshard/Coordinates.h>
#include <reshard/Dataset.h>
#include <reshard/ProgressLogger.h>

namespace reshard::test {

using std::map;
using std::string;
using std::vector;

constexpr const char* kFrontCamera = "observation.images.front";
constexpr const char* kWristCamera = "observation.images.wrist";
constexpr const char* kActionFeature = "action";
constexpr const char* kStateFeature = "observation.state";

/// Parameterization of the synthetic datasets, so we can simulate various sharding cases.
/// By default, the data & meta/episodes stores are sharded differently from the videos,
/// and the two video keys are sharded differently from one another.
struct SyntheticDatasetConfig {
  double fps = 10;
  vector<uint32_t> episodeLengths = {5, 8, 3, 6, 4, 7, 2, 5, 9, 4, 6, 3};
  // tasks of episode i: taskSets[i % taskSets.size()]
  vector<vector<string>> taskSets = {
      {"put the bowl on the plate"},
      {"open the drawer"},
      {"pick up the cup", "place it in the basket"}};
  vector<string> videoKeys = {kFrontCamera, kWristCamera};
  uint32_t dataEpisodesPerFile = 5;
  uint32_t metaEpisodesPerFile = 4;
  // for each video key, in order. The last value is used for the following keys.
  vector<uint32_t> videoEpisodesPerFile = {3, 2};
  uint32_t chunksSize = 3;
  // episodes without a stream, per video key
  map<string, vector<uint32_t>> missingVideos;
  // added to length/fps for the video spans' duration, like encoders reporting a longer duration
  double extraVideoDuration = 0;
};

/// Silent progress logger requesting to stop after a number of progress notifications.
class CancellingLogger : public SilentLogger {
 public:
  explicit CancellingLogger(uint32_t notificationsBeforeCancel)
      : notificationsLeft_{notificationsBeforeCancel} {}

  bool shouldKeepGoing() override {
    if (notificationsLeft_ == 0) {
      cancelled_ = true;
      return false;
    }
    notificationsLeft_--;
    return true;
  }
  bool wasCancelled() const {
    return cancelled_;
  }

 private:
  uint32_t notificationsLeft_;
  bool cancelled_{false};
};

/// Backends using json table files & raw video files.
Backends getTestBackends();

/// Register the test backends in the BackendFactory, once, as defaults.
void registerTestBackends();

/// Unique path in the temp folder, for a dataset to be created by a test.
string getTestDatasetPath(const string& name);

/// Deterministic feature values, so tests can tell where a frame came from.
vector<float> makeActionValues(uint32_t episodeIndex, uint32_t frameIndex);

/// Create a synthetic dataset on disk, then open it.
/// @return 0 on success, or an error code.
int createSyntheticDataset(
    const string& root,
    const SyntheticDatasetConfig& config,
    DatasetPtr& outDataset);

/// Expected episodes of a synthetic dataset, as written to disk.
vector<EpisodeRecord> makeSyntheticEpisodes(const SyntheticDatasetConfig& config);

} // namespace reshard::test
