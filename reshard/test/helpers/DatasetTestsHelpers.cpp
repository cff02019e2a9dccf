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

#include "DatasetTestsHelpers.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <set>

#define DEFAULT_LOG_CHANNEL "DatasetTestsHelpers"
#include <logging/Log.h>

#include <reshard/DatasetInfo.h>
#include <reshard/DatasetLayout.h>
#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/os/Utils.h>

#include "JsonTableFileHandler.h"
#include "RawFrameCodec.h"

using namespace std;

namespace {

using namespace reshard;
using namespace reshard::test;

uint32_t episodesPerVideoFile(const SyntheticDatasetConfig& config, size_t keyIndex) {
  const vector<uint32_t>& counts = config.videoEpisodesPerFile;
  return counts.empty() ? 1 : counts[min(keyIndex, counts.size() - 1)];
}

// Assign coordinates to consecutive groups of episodes
vector<ShardCoordinate>
makeCoordinates(uint32_t episodeCount, uint32_t episodesPerFile, uint32_t chunksSize) {
  vector<ShardCoordinate> coordinates;
  ShardCoordinate coordinate;
  for (uint32_t k = 0; k < episodeCount; k++) {
    if (k > 0 && k % episodesPerFile == 0) {
      coordinate = coordinate.next(chunksSize);
    }
    coordinates.push_back(coordinate);
  }
  return coordinates;
}

} // namespace

namespace reshard::test {

Backends getTestBackends() {
  static Backends sBackends{make_shared<JsonTableFileHandler>(), make_shared<RawFrameCodec>()};
  return sBackends;
}

void registerTestBackends() {
  static once_flag sOnceFlag;
  call_once(sOnceFlag, [] {
    Backends backends = getTestBackends();
    BackendFactory::getInstance().registerTableFileHandler(backends.tables);
    BackendFactory::getInstance().registerVideoCodec(backends.video);
  });
}

string getTestDatasetPath(const string& name) {
  return os::getUniquePath(os::getTempFolder() + name);
}

vector<float> makeActionValues(uint32_t episodeIndex, uint32_t frameIndex) {
  return {static_cast<float>(episodeIndex) * 1000 + frameIndex, 0.25f * frameIndex};
}

vector<EpisodeRecord> makeSyntheticEpisodes(const SyntheticDatasetConfig& config) {
  const uint32_t episodeCount = static_cast<uint32_t>(config.episodeLengths.size());
  vector<ShardCoordinate> dataCoordinates =
      makeCoordinates(episodeCount, config.dataEpisodesPerFile, config.chunksSize);
  vector<ShardCoordinate> metaCoordinates =
      makeCoordinates(episodeCount, config.metaEpisodesPerFile, config.chunksSize);

  vector<EpisodeRecord> episodes(episodeCount);
  GlobalIndex nextIndex{0};
  for (uint32_t k = 0; k < episodeCount; k++) {
    EpisodeRecord& episode = episodes[k];
    episode.episodeIndex = k;
    episode.length = config.episodeLengths[k];
    episode.datasetFromIndex = nextIndex;
    episode.datasetToIndex = nextIndex.advancedBy(episode.length);
    episode.tasks = config.taskSets[k % config.taskSets.size()];
    episode.dataCoordinate = dataCoordinates[k];
    episode.metaCoordinate = metaCoordinates[k];
    nextIndex = episode.datasetToIndex;
  }
  for (size_t keyIndex = 0; keyIndex < config.videoKeys.size(); keyIndex++) {
    const string& key = config.videoKeys[keyIndex];
    vector<ShardCoordinate> coordinates =
        makeCoordinates(episodeCount, episodesPerVideoFile(config, keyIndex), config.chunksSize);
    auto missing = config.missingVideos.find(key);
    double fileTime = 0;
    for (uint32_t k = 0; k < episodeCount; k++) {
      if (k == 0 || coordinates[k] != coordinates[k - 1]) {
        fileTime = 0;
      }
      if (missing != config.missingVideos.end() &&
          find(missing->second.begin(), missing->second.end(), k) != missing->second.end()) {
        continue;
      }
      EpisodeRecord& episode = episodes[k];
      VideoSpan& span = episode.videos[key];
      span.coordinate = coordinates[k];
      span.fromTimestamp = SeekTime(fileTime);
      fileTime += episode.length / config.fps + config.extraVideoDuration;
      span.toTimestamp = SeekTime(fileTime);
    }
  }
  return episodes;
}

int createSyntheticDataset(
    const string& root,
    const SyntheticDatasetConfig& config,
    DatasetPtr& outDataset) {
  const Backends backends = getTestBackends();
  vector<EpisodeRecord> episodes = makeSyntheticEpisodes(config);

  DatasetInfo info;
  info.robotType = "test_arm";
  info.fps = config.fps;
  info.chunksSize = config.chunksSize;
  info.totalEpisodes = static_cast<uint32_t>(episodes.size());
  set<string> tasks;
  for (const EpisodeRecord& episode : episodes) {
    info.totalFrames += episode.length;
    tasks.insert(episode.tasks.begin(), episode.tasks.end());
  }
  info.totalTasks = static_cast<uint32_t>(tasks.size());
  info.features.push_back({kActionFeature, "float32", {2}});
  info.features.push_back({kStateFeature, "float32", {1}});
  for (const string& key : config.videoKeys) {
    info.features.push_back({key, FeatureInfo::kVideoDtype, {2, 4, 3}});
  }
  DatasetLayout layout;
  IF_ERROR_RETURN(DatasetLayout::create(info, layout));
  IF_ERROR_RETURN(os::makeDirectories(os::pathJoin(root, "meta")));
  IF_ERROR_RETURN(info.writeToDataset(root));
  IF_ERROR_RETURN(os::writeTextFile(
      os::pathJoin(root, "meta/tasks.jsonl"),
      "{\"task_index\": 0, \"task\": \"put the bowl on the plate\"}\n"));

  map<ShardCoordinate, vector<FrameRecord>> dataShards;
  map<ShardCoordinate, vector<EpisodeRecord>> metaShards;
  map<pair<string, ShardCoordinate>, vector<VideoFrame>> videoShards;
  vector<string> tasksList(tasks.begin(), tasks.end());
  for (const EpisodeRecord& episode : episodes) {
    metaShards[episode.metaCoordinate].push_back(episode);
    vector<FrameRecord>& frames = dataShards[episode.dataCoordinate];
    const string& firstTask = episode.tasks.front();
    int64_t taskIndex = find(tasksList.begin(), tasksList.end(), firstTask) - tasksList.begin();
    for (uint32_t f = 0; f < episode.length; f++) {
      FrameRecord frame;
      frame.index = episode.datasetFromIndex.advancedBy(f);
      frame.episodeIndex = episode.episodeIndex;
      frame.frameIndex = f;
      frame.timestamp = EpisodeTime::fromFrameIndex(f, config.fps);
      frame.taskIndex = taskIndex;
      frame.features[kActionFeature] = makeActionValues(episode.episodeIndex, f);
      frame.features[kStateFeature] = {static_cast<float>(f) / episode.length};
      frames.push_back(move(frame));
    }
    for (uint32_t keyIndex = 0; keyIndex < config.videoKeys.size(); keyIndex++) {
      const string& key = config.videoKeys[keyIndex];
      const VideoSpan* span = episode.findVideo(key);
      if (span != nullptr) {
        vector<VideoFrame>& videoFrames = videoShards[{key, span->coordinate}];
        for (uint32_t f = 0; f < episode.length; f++) {
          videoFrames.push_back(makeTestFrame(keyIndex, episode.episodeIndex, f));
        }
      }
    }
  }
  for (const auto& shard : dataShards) {
    string path = os::pathJoin(root, layout.dataFilePath(shard.first));
    IF_ERROR_RETURN(os::makeDirectories(os::getParentFolder(path)));
    IF_ERROR_RETURN(backends.tables->writeFrames(path, shard.second));
  }
  for (const auto& shard : metaShards) {
    string path = os::pathJoin(root, layout.episodesFilePath(shard.first));
    IF_ERROR_RETURN(os::makeDirectories(os::getParentFolder(path)));
    IF_ERROR_RETURN(backends.tables->writeEpisodes(path, shard.second));
  }
  VideoEncodeSettings settings;
  settings.fps = config.fps;
  for (const auto& shard : videoShards) {
    string path = os::pathJoin(root, layout.videoFilePath(shard.first.first, shard.first.second));
    IF_ERROR_RETURN(os::makeDirectories(os::getParentFolder(path)));
    IF_ERROR_RETURN(backends.video->encodeFrames(path, shard.second, settings));
  }
  Dataset::OpenOptions options;
  options.backends = backends;
  return Dataset::open(root, outDataset, options);
}

} // namespace reshard::test
