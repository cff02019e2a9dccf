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

#include <reshard/DatasetInfo.h>

#define DEFAULT_LOG_CHANNEL "DatasetInfo"
#include <logging/Log.h>
#include <logging/Verify.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/helpers/Rapidjson.hpp>
#include <reshard/os/Utils.h>

using namespace std;

namespace {

const char* kCodebaseVersion = "codebase_version";
const char* kRobotType = "robot_type";
const char* kFps = "fps";
const char* kTotalEpisodes = "total_episodes";
const char* kTotalFrames = "total_frames";
const char* kTotalTasks = "total_tasks";
const char* kChunksSize = "chunks_size";
const char* kDataFilesSizeInMb = "data_files_size_in_mb";
const char* kVideoFilesSizeInMb = "video_files_size_in_mb";
const char* kDataPath = "data_path";
const char* kVideoPath = "video_path";
const char* kEpisodesPath = "episodes_path";
const char* kFeatures = "features";
const char* kDtype = "dtype";
const char* kShape = "shape";
const char* kDataFiles = "data_files";

} // namespace

namespace reshard {

vector<string> DatasetInfo::getVideoKeys() const {
  vector<string> keys;
  for (const FeatureInfo& feature : features) {
    if (feature.isVideo()) {
      keys.push_back(feature.name);
    }
  }
  return keys;
}

const FeatureInfo* DatasetInfo::findFeature(const string& name) const {
  for (const FeatureInfo& feature : features) {
    if (feature.name == name) {
      return &feature;
    }
  }
  return nullptr;
}

int DatasetInfo::fromJson(const string& jsonText) {
  using namespace reshard_rapidjson;
  JDocument document;
  if (!jParse(document, jsonText) || !document.IsObject()) {
    RS_LOGE("Can't parse dataset info: {}", jParseErrorMessage(document));
    return INVALID_DATASET_INFO;
  }
  *this = DatasetInfo();
  getJString(codebaseVersion, document, kCodebaseVersion);
  getJString(robotType, document, kRobotType);
  int64_t value = 0;
  if (!getJDouble(fps, document, kFps) || fps <= 0 ||
      !getJInt64(value, document, kTotalEpisodes)) {
    RS_LOGE("Dataset info misses a valid '{}' or '{}' value.", kFps, kTotalEpisodes);
    return INVALID_DATASET_INFO;
  }
  totalEpisodes = static_cast<uint32_t>(value);
  if (getJInt64(value, document, kTotalFrames)) {
    totalFrames = static_cast<uint64_t>(value);
  }
  if (getJInt64(value, document, kTotalTasks)) {
    totalTasks = static_cast<uint32_t>(value);
  }
  if (!getJUInt32(chunksSize, document, kChunksSize) || chunksSize == 0) {
    chunksSize = ShardCoordinate::kDefaultChunksSize;
  }
  double size = 0;
  if (getJDouble(size, document, kDataFilesSizeInMb)) {
    dataFilesSizeInMb = size;
  }
  if (getJDouble(size, document, kVideoFilesSizeInMb)) {
    videoFilesSizeInMb = size;
  }
  string path;
  if (getJString(path, document, kDataPath)) {
    dataPath = path;
  }
  if (getJString(path, document, kVideoPath)) {
    videoPath = path;
  }
  if (getJString(path, document, kEpisodesPath)) {
    episodesPath = path;
  }
  const JValue::ConstMemberIterator jfeatures = document.FindMember(kFeatures);
  if (jfeatures != document.MemberEnd() && jfeatures->value.IsObject()) {
    for (auto iter = jfeatures->value.MemberBegin(); iter != jfeatures->value.MemberEnd(); ++iter) {
      FeatureInfo feature;
      feature.name = iter->name.GetString();
      if (!iter->value.IsObject() || !getJString(feature.dtype, iter->value, kDtype)) {
        RS_LOGE("Feature '{}' has no valid dtype.", feature.name);
        return INVALID_DATASET_INFO;
      }
      if (!RS_VERIFY(
              getJVector(feature.shape, iter->value, kShape),
              "Feature '{}' has no shape.",
              feature.name)) {
        feature.shape.clear();
      }
      features.emplace_back(std::move(feature));
    }
  }
  getJVector(dataFiles, document, kDataFiles);
  return SUCCESS;
}

string DatasetInfo::toJson() const {
  using namespace reshard_rapidjson;
  JDocument document;
  JsonWrapper wrapper{document};
  wrapper.addMember(kCodebaseVersion, codebaseVersion);
  wrapper.addMember(kRobotType, robotType);
  wrapper.addMember(kTotalEpisodes, totalEpisodes);
  wrapper.addMember(kTotalFrames, totalFrames);
  wrapper.addMember(kTotalTasks, totalTasks);
  wrapper.addMember(kChunksSize, chunksSize);
  wrapper.addMember(kDataFilesSizeInMb, dataFilesSizeInMb);
  wrapper.addMember(kVideoFilesSizeInMb, videoFilesSizeInMb);
  wrapper.addMember(kFps, fps);
  wrapper.addMember(kDataPath, dataPath);
  wrapper.addMember(kVideoPath, videoPath);
  wrapper.addMember(kEpisodesPath, episodesPath);
  JValue jfeatures(kObjectType);
  for (const FeatureInfo& feature : features) {
    JValue jfeature(kObjectType);
    JsonWrapper featureWrapper{jfeature, wrapper.alloc};
    featureWrapper.addMember(kDtype, feature.dtype);
    serializeVector(feature.shape, featureWrapper, kShape);
    jfeatures.AddMember(wrapper.jValue(feature.name), jfeature, wrapper.alloc);
  }
  wrapper.addMember(kFeatures, jfeatures);
  if (!dataFiles.empty()) {
    serializeStringRefVector(dataFiles, wrapper, kDataFiles);
  }
  return jDocumentToJsonStringPretty(document);
}

int DatasetInfo::readFromDataset(const string& datasetRoot) {
  string path = os::pathJoin(datasetRoot, kInfoJsonPath);
  if (!os::isFile(path)) {
    RS_LOGE("No dataset info file at '{}'", path);
    return FILE_NOT_FOUND;
  }
  string jsonText;
  IF_ERROR_LOG_AND_RETURN(os::readTextFile(path, jsonText));
  return fromJson(jsonText);
}

int DatasetInfo::writeToDataset(const string& datasetRoot) const {
  string path = os::pathJoin(datasetRoot, kInfoJsonPath);
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(os::getParentFolder(path)));
  IF_ERROR_LOG_AND_RETURN(os::writeTextFile(path, toJson()));
  return SUCCESS;
}

} // namespace reshard
