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

#include <reshard/Dataset.h>

#include <algorithm>

#define DEFAULT_LOG_CHANNEL "Dataset"
#include <logging/Log.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/os/Utils.h>

using namespace std;

namespace reshard {

int Dataset::open(const string& root, DatasetPtr& outDataset, const OpenOptions& options) {
  outDataset.reset();
  if (!os::isDir(root)) {
    RS_LOGE("No dataset folder at '{}'", root);
    return FILE_NOT_FOUND;
  }
  unique_ptr<Dataset> dataset(new Dataset());
  dataset->root_ = root;
  IF_ERROR_RETURN(dataset->info_.readFromDataset(root));
  IF_ERROR_RETURN(DatasetLayout::create(dataset->info_, dataset->layout_));
  dataset->backends_ = options.backends;
  if (!dataset->backends_.tables || !dataset->backends_.video) {
    Backends found;
    IF_ERROR_RETURN(BackendFactory::getInstance().getBackends(
        options.tableHandlerName, options.videoCodecName, found));
    if (!dataset->backends_.tables) {
      dataset->backends_.tables = found.tables;
    }
    if (!dataset->backends_.video) {
      dataset->backends_.video = found.video;
    }
  }
  bool manifestRead = false;
  IF_ERROR_RETURN(dataset->readEpisodes(manifestRead));
  IF_ERROR_RETURN(dataset->checkEpisodes());
  ShardManifest builtManifest;
  IF_ERROR_RETURN(builtManifest.build(dataset->episodes_, dataset->layout_, root));
  if (!manifestRead) {
    dataset->manifest_ = std::move(builtManifest);
  } else if (!dataset->manifest_.hasSamePartition(builtManifest)) {
    RS_LOGE("The manifest of '{}' doesn't match its episodes: it's stale.", root);
    return SHARD_CONSISTENCY_ERROR;
  }
  dataset->resolver_ = make_unique<TimestampResolver>(dataset->info_.fps, dataset->episodes_);
  RS_LOGD(
      "Opened '{}': {} episodes, {} frames, {} data shards.",
      root,
      dataset->episodes_.size(),
      dataset->getFrameCount(),
      dataset->manifest_.getShardCount(kDataStore));
  outDataset.reset(dataset.release());
  return SUCCESS;
}

int Dataset::readEpisodes(bool& outManifestRead) {
  outManifestRead = false;
  vector<string> episodeFiles;
  if (os::isFile(os::pathJoin(root_, ShardManifest::kManifestJsonPath))) {
    IF_ERROR_RETURN(manifest_.readFromDataset(root_));
    vector<ShardDescriptor> shards;
    IF_ERROR_RETURN(manifest_.listShards(kEpisodesStore, shards));
    for (const ShardDescriptor& shard : shards) {
      episodeFiles.push_back(shard.path);
    }
    outManifestRead = true;
  } else {
    IF_ERROR_RETURN(DatasetLayout::listStoreFiles(root_, info_.episodesPath, episodeFiles));
  }
  episodes_.clear();
  for (const string& file : episodeFiles) {
    vector<EpisodeRecord> episodes;
    IF_ERROR_LOG_AND_RETURN(backends_.tables->readEpisodes(getPath(file), episodes));
    episodes_.insert(
        episodes_.end(), make_move_iterator(episodes.begin()), make_move_iterator(episodes.end()));
  }
  sort(episodes_.begin(), episodes_.end(), [](const EpisodeRecord& l, const EpisodeRecord& r) {
    return l.episodeIndex < r.episodeIndex;
  });
  return SUCCESS;
}

int Dataset::checkEpisodes() const {
  if (episodes_.size() != info_.totalEpisodes) {
    RS_LOGE(
        "'{}' has {} episodes, but its info says {}.",
        root_,
        episodes_.size(),
        info_.totalEpisodes);
    return INVALID_DATASET_INFO;
  }
  for (size_t index = 0; index < episodes_.size(); ++index) {
    const EpisodeRecord& episode = episodes_[index];
    if (episode.episodeIndex != index) {
      RS_LOGE("Episode indexes aren't dense: #{} is episode {}.", index, episode.episodeIndex);
      return SHARD_CONSISTENCY_ERROR;
    }
    for (const auto& video : episode.videos) {
      if (video.second.duration() < 0) {
        RS_LOGE("Episode {} has a negative duration in '{}'.", index, video.first);
        return SHARD_CONSISTENCY_ERROR;
      }
    }
  }
  uint64_t frameCount = getFrameCount();
  if (info_.totalFrames != 0 && frameCount != info_.totalFrames) {
    RS_LOGE("'{}' has {} frames, but its info says {}.", root_, frameCount, info_.totalFrames);
    return INVALID_DATASET_INFO;
  }
  return SUCCESS;
}

const EpisodeRecord* Dataset::getEpisode(uint32_t episodeIndex) const {
  return episodeIndex < episodes_.size() ? &episodes_[episodeIndex] : nullptr;
}

uint64_t Dataset::getFrameCount() const {
  if (episodes_.empty()) {
    return 0;
  }
  return episodes_.back().datasetToIndex.distanceFrom(episodes_.front().datasetFromIndex);
}

string Dataset::getPath(const string& relativePath) const {
  return os::pathJoin(root_, relativePath);
}

int Dataset::findEpisode(GlobalIndex index, uint32_t& outEpisodeIndex) const {
  auto iter = upper_bound(
      episodes_.begin(), episodes_.end(), index, [](GlobalIndex value, const EpisodeRecord& ep) {
        return value < ep.datasetFromIndex;
      });
  if (iter == episodes_.begin() || !(--iter)->containsIndex(index)) {
    return FRAME_NOT_FOUND;
  }
  outEpisodeIndex = iter->episodeIndex;
  return SUCCESS;
}

int Dataset::readEpisodeFrames(uint32_t episodeIndex, vector<FrameRecord>& outFrames) const {
  outFrames.clear();
  const EpisodeRecord* episode = getEpisode(episodeIndex);
  if (episode == nullptr) {
    return EPISODE_NOT_FOUND;
  }
  if (episode->length == 0) {
    return SUCCESS;
  }
  ShardLocation location;
  IF_ERROR_RETURN(manifest_.resolve(kDataStore, episode->datasetFromIndex, location));
  IF_ERROR_LOG_AND_RETURN(backends_.tables->readFrameRange(
      getPath(location.path), location.localOffset, episode->length, outFrames));
  if (outFrames.size() != episode->length || outFrames.front().index != episode->datasetFromIndex ||
      outFrames.back().episodeIndex != episodeIndex) {
    RS_LOGE("The rows of '{}' don't match episode {}.", location.path, episodeIndex);
    outFrames.clear();
    return SHARD_CONSISTENCY_ERROR;
  }
  return SUCCESS;
}

} // namespace reshard
