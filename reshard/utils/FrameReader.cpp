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

#include <reshard/utils/FrameReader.h>

#define DEFAULT_LOG_CHANNEL "FrameReader"
#include <logging/Checks.h>
#include <logging/Log.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>

using namespace std;

namespace reshard::utils {

FrameReader::FrameReader(DatasetPtr dataset) : dataset_{std::move(dataset)} {
  RS_CHECK_NOTNULL(dataset_);
}

int FrameReader::readFrame(
    GlobalIndex index,
    const vector<double>& deltas,
    FrameSample& outSample,
    const vector<string>& videoKeys) const {
  outSample.clear();
  uint32_t episodeIndex = 0;
  IF_ERROR_RETURN(dataset_->findEpisode(index, episodeIndex));
  const EpisodeRecord& episode = *dataset_->getEpisode(episodeIndex);
  IF_ERROR_RETURN(readFrameRow(index, outSample.frame));
  uint32_t frameIndex = static_cast<uint32_t>(index.distanceFrom(episode.datasetFromIndex));
  outSample.deltas = deltas;
  int status = decodeVideoFrames(episode, frameIndex, videoKeys, outSample);
  if (status != 0) {
    outSample.clear();
  }
  return status;
}

int FrameReader::readEpisodeFrame(
    uint32_t episodeIndex,
    uint32_t frameIndex,
    const vector<double>& deltas,
    FrameSample& outSample,
    const vector<string>& videoKeys) const {
  const EpisodeRecord* episode = dataset_->getEpisode(episodeIndex);
  if (episode == nullptr) {
    outSample.clear();
    return EPISODE_NOT_FOUND;
  }
  if (frameIndex >= episode->length) {
    outSample.clear();
    return FRAME_NOT_FOUND;
  }
  return readFrame(episode->datasetFromIndex.advancedBy(frameIndex), deltas, outSample, videoKeys);
}

int FrameReader::readFrameRow(GlobalIndex index, FrameRecord& outFrame) const {
  ShardLocation location;
  int status = dataset_->getManifest().resolve(kDataStore, index, location);
  if (status == INVALID_RANGE) {
    return FRAME_NOT_FOUND;
  }
  IF_ERROR_RETURN(status);
  vector<FrameRecord> rows;
  IF_ERROR_LOG_AND_RETURN(dataset_->getBackends().tables->readFrameRange(
      dataset_->getPath(location.path), location.localOffset, 1, rows));
  if (rows.size() != 1 || rows.front().index != index) {
    RS_LOGE(
        "Row {} of '{}' isn't frame {}.", location.localOffset, location.path, index.value());
    return SHARD_CONSISTENCY_ERROR;
  }
  outFrame = std::move(rows.front());
  return SUCCESS;
}

int FrameReader::decodeVideoFrames(
    const EpisodeRecord& episode,
    uint32_t frameIndex,
    const vector<string>& videoKeys,
    FrameSample& outSample) const {
  if (outSample.deltas.empty()) {
    return SUCCESS;
  }
  map<string, vector<ResolvedSeek>> seeks;
  IF_ERROR_RETURN(dataset_->getResolver().resolveFrame(
      episode.episodeIndex, frameIndex, outSample.deltas, videoKeys, seeks));
  const VideoCodec& codec = *dataset_->getBackends().video;
  for (const auto& keySeeks : seeks) {
    const string& key = keySeeks.first;
    vector<SeekTime> seekTimes;
    vector<bool>& padding = outSample.isPadding[key];
    seekTimes.reserve(keySeeks.second.size());
    padding.reserve(keySeeks.second.size());
    for (const ResolvedSeek& seek : keySeeks.second) {
      seekTimes.push_back(seek.seekTime);
      padding.push_back(seek.isPadding);
    }
    const VideoSpan* span = episode.findVideo(key);
    string path = dataset_->getPath(dataset_->getLayout().videoFilePath(key, span->coordinate));
    vector<VideoFrame>& frames = outSample.videoFrames[key];
    int status = codec.decodeFrames(path, seekTimes, frames);
    if (status != 0) {
      RS_LOGE("Can't decode frames of '{}': {}", path, errorCodeToMessage(status));
      return isMediaCodecError(status) ? status : MEDIA_DECODE_ERROR;
    }
    if (frames.size() != seekTimes.size()) {
      RS_LOGE("Decoded {} frames from '{}', expected {}.", frames.size(), path, seekTimes.size());
      return MEDIA_DECODE_ERROR;
    }
  }
  return SUCCESS;
}

} // namespace reshard::utils
