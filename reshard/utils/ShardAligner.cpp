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

#include <reshard/utils/ShardAligner.h>

#include <set>
#include <vector>

#define DEFAULT_LOG_CHANNEL "ShardAligner"
#include <logging/Checks.h>
#include <logging/Log.h>

#include <reshard/DatasetWriter.h>
#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/os/Time.h>

using namespace std;

namespace {

using namespace reshard;

/// Consecutive episodes sharing the same reference video coordinate.
struct AlignedShard {
  ShardCoordinate coordinate;
  vector<uint32_t> episodeIndexes;
};

int planShards(
    const Dataset& source,
    const string& referenceKey,
    vector<AlignedShard>& outShards) {
  set<ShardCoordinate> closedCoordinates;
  for (const EpisodeRecord& episode : source.getEpisodes()) {
    const VideoSpan* span = episode.findVideo(referenceKey);
    if (span == nullptr) {
      RS_LOGE("Episode {} has no '{}' video.", episode.episodeIndex, referenceKey);
      return MISSING_VIDEO_STREAM;
    }
    if (outShards.empty() || outShards.back().coordinate != span->coordinate) {
      if (closedCoordinates.find(span->coordinate) != closedCoordinates.end()) {
        RS_LOGE(
            "Episode {} returns to the '{}' video shard {} after leaving it.",
            episode.episodeIndex,
            referenceKey,
            span->coordinate.toString());
        return SHARD_CONSISTENCY_ERROR;
      }
      if (!outShards.empty()) {
        closedCoordinates.insert(outShards.back().coordinate);
      }
      outShards.emplace_back();
      outShards.back().coordinate = span->coordinate;
    }
    outShards.back().episodeIndexes.push_back(episode.episodeIndex);
  }
  return SUCCESS;
}

void findDivergences(const Dataset& source, const string& referenceKey, utils::AlignReport& report) {
  for (const EpisodeRecord& episode : source.getEpisodes()) {
    const ShardCoordinate& reference = episode.findVideo(referenceKey)->coordinate;
    for (const auto& video : episode.videos) {
      if (video.first != referenceKey && video.second.coordinate != reference) {
        report.divergentEpisodeCounts[video.first]++;
      }
    }
  }
  for (const auto& divergence : report.divergentEpisodeCounts) {
    RS_LOGW(
        "{} episodes of the '{}' video are not in the same shard as their '{}' video.",
        divergence.second,
        divergence.first,
        referenceKey);
  }
}

int copyVideoShards(const Dataset& source, DatasetWriter& writer, ProgressLogger& logger) {
  vector<ShardDescriptor> shards;
  for (const string& key : source.getVideoKeys()) {
    vector<ShardDescriptor> keyShards;
    if (source.getManifest().listShards(videoStoreId(key), keyShards) == 0) {
      shards.insert(shards.end(), keyShards.begin(), keyShards.end());
    }
  }
  const string stepName = "Copying videos";
  logger.logNewStep(stepName, 0, shards.size());
  for (size_t k = 0; k < shards.size(); k++) {
    if (!logger.logProgress(stepName, k, shards.size())) {
      return OPERATION_CANCELLED;
    }
    IF_ERROR_RETURN(writer.copyFile(source.getPath(shards[k].path), shards[k].path));
  }
  return logger.logStatus(stepName) ? SUCCESS : OPERATION_CANCELLED;
}

} // namespace

namespace reshard::utils {

int alignShards(
    const DatasetPtr& source,
    const string& outputPath,
    const AlignOptions& options,
    DatasetPtr& outDataset,
    AlignReport& outReport,
    ProgressLogger* progressLogger) {
  RS_CHECK_NOTNULL(source);
  SilentLogger silentLogger;
  ProgressLogger& logger = progressLogger != nullptr ? *progressLogger : silentLogger;
  double startTime = os::getTimestampSec();
  outReport = {};

  vector<string> videoKeys = source->getVideoKeys();
  const string referenceKey = options.referenceVideoKey.empty() && !videoKeys.empty()
      ? videoKeys.front()
      : options.referenceVideoKey;
  if (referenceKey.empty() ||
      source->getManifest().getShardCount(videoStoreId(referenceKey)) == 0) {
    RS_LOGE("No '{}' video shard to align with.", referenceKey);
    return MISSING_VIDEO_STREAM;
  }
  vector<AlignedShard> shards;
  IF_ERROR_RETURN(planShards(*source, referenceKey, shards));
  outReport.referenceVideoKey = referenceKey;
  findDivergences(*source, referenceKey, outReport);

  const int kExtraSteps = 3;
  logger.setStepCount(kExtraSteps + (options.copyVideos ? 1 : 0));
  DatasetWriter writer(outputPath, source->getBackends());
  IF_ERROR_RETURN(writer.create());

  const DatasetLayout& layout = source->getLayout();
  vector<EpisodeRecord> alignedEpisodes;
  alignedEpisodes.reserve(source->getEpisodeCount());
  vector<string> dataFiles;
  const string stepName = "Writing data shards";
  logger.logNewStep(stepName, 0, shards.size());
  for (size_t s = 0; s < shards.size(); s++) {
    if (!logger.logProgress(stepName, s, shards.size())) {
      return OPERATION_CANCELLED;
    }
    const AlignedShard& shard = shards[s];
    vector<FrameRecord> shardFrames;
    vector<EpisodeRecord> shardEpisodes;
    for (uint32_t episodeIndex : shard.episodeIndexes) {
      vector<FrameRecord> frames;
      IF_ERROR_RETURN(source->readEpisodeFrames(episodeIndex, frames));
      shardFrames.insert(shardFrames.end(), frames.begin(), frames.end());
      EpisodeRecord episode = *source->getEpisode(episodeIndex);
      episode.dataCoordinate = shard.coordinate;
      episode.metaCoordinate = shard.coordinate;
      shardEpisodes.push_back(episode);
    }
    string dataPath = layout.dataFilePath(shard.coordinate);
    IF_ERROR_RETURN(writer.writeFrames(dataPath, shardFrames));
    IF_ERROR_RETURN(writer.writeEpisodes(layout.episodesFilePath(shard.coordinate), shardEpisodes));
    dataFiles.push_back(dataPath);
    alignedEpisodes.insert(alignedEpisodes.end(), shardEpisodes.begin(), shardEpisodes.end());
  }
  if (!logger.logStatus(stepName)) {
    return OPERATION_CANCELLED;
  }
  outReport.shardCount = static_cast<uint32_t>(shards.size());

  if (options.copyVideos) {
    IF_ERROR_RETURN(copyVideoShards(*source, writer, logger));
  }
  if (options.copyMetaFiles) {
    IF_ERROR_RETURN(writer.copyMetaFiles(*source));
  }

  if (!logger.logNewStep("Writing manifest")) {
    return OPERATION_CANCELLED;
  }
  ShardManifest manifest;
  IF_ERROR_LOG_AND_RETURN(manifest.build(alignedEpisodes, layout, writer.getStagingPath()));
  IF_ERROR_RETURN(writer.writeManifest(manifest));
  DatasetInfo info = source->getInfo();
  if (!info.dataFiles.empty()) {
    info.dataFiles = dataFiles;
  }
  IF_ERROR_RETURN(writer.writeInfo(info));

  if (!logger.logNewStep("Publishing")) {
    return OPERATION_CANCELLED;
  }
  IF_ERROR_RETURN(writer.publish());
  logger.logDuration("Alignment", os::getTimestampSec() - startTime);

  Dataset::OpenOptions openOptions;
  openOptions.backends = source->getBackends();
  return Dataset::open(outputPath, outDataset, openOptions);
}

} // namespace reshard::utils
