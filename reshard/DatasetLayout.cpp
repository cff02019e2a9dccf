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

#include <reshard/DatasetLayout.h>

#include <algorithm>

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "DatasetLayout"
#include <logging/Log.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/helpers/Strings.h>
#include <reshard/os/Utils.h>

using namespace std;

namespace {

const char* kSampleVideoKey = "observation.images.sample";

string
formatPath(const string& pathTemplate, const reshard::ShardCoordinate& c, const string& key) {
  try {
    return fmt::format(
        fmt::runtime(pathTemplate),
        fmt::arg("chunk_index", c.chunkIndex),
        fmt::arg("file_index", c.fileIndex),
        fmt::arg("video_key", key));
  } catch (const fmt::format_error& error) {
    RS_LOGE("Can't format path template '{}': {}", pathTemplate, error.what());
  }
  return {};
}

} // namespace

namespace reshard {

bool DatasetLayout::checkTemplate(const string& pathTemplate, bool needsVideoKey) {
  if (pathTemplate.find("{chunk_index") == string::npos ||
      pathTemplate.find("{file_index") == string::npos ||
      (needsVideoKey && pathTemplate.find("{video_key") == string::npos)) {
    RS_LOGE("Path template '{}' misses a required field.", pathTemplate);
    return false;
  }
  string sample = formatPath(pathTemplate, {12, 34}, kSampleVideoKey);
  return !sample.empty() && (!needsVideoKey || sample.find(kSampleVideoKey) != string::npos);
}

int DatasetLayout::create(const DatasetInfo& info, DatasetLayout& outLayout) {
  if (!checkTemplate(info.dataPath, false) || !checkTemplate(info.episodesPath, false) ||
      !checkTemplate(info.videoPath, true)) {
    return INVALID_PATH_TEMPLATE;
  }
  outLayout.dataPath_ = info.dataPath;
  outLayout.videoPath_ = info.videoPath;
  outLayout.episodesPath_ = info.episodesPath;
  return SUCCESS;
}

string DatasetLayout::dataFilePath(const ShardCoordinate& coordinate) const {
  return formatPath(dataPath_, coordinate, {});
}

string DatasetLayout::episodesFilePath(const ShardCoordinate& coordinate) const {
  return formatPath(episodesPath_, coordinate, {});
}

string DatasetLayout::videoFilePath(const string& videoKey, const ShardCoordinate& coordinate)
    const {
  return formatPath(videoPath_, coordinate, videoKey);
}

string DatasetLayout::storeFilePath(const string& storeId, const ShardCoordinate& coordinate)
    const {
  string videoKey;
  if (storeId == kDataStore) {
    return dataFilePath(coordinate);
  } else if (storeId == kEpisodesStore) {
    return episodesFilePath(coordinate);
  } else if (isVideoStoreId(storeId, videoKey)) {
    return videoFilePath(videoKey, coordinate);
  }
  return {};
}

int DatasetLayout::listStoreFiles(
    const string& datasetRoot,
    const string& pathTemplate,
    vector<string>& outRelativePaths) {
  outRelativePaths.clear();
  // everything up to the first templated folder is fixed
  size_t fieldStart = pathTemplate.find('{');
  if (fieldStart == string::npos) {
    RS_LOGE("Invalid path template '{}'", pathTemplate);
    return INVALID_PATH_TEMPLATE;
  }
  size_t folderEnd = pathTemplate.rfind('/', fieldStart);
  string folder = folderEnd == string::npos ? string() : pathTemplate.substr(0, folderEnd);
  size_t dot = pathTemplate.rfind('.');
  string extension = dot != string::npos && dot > fieldStart ? pathTemplate.substr(dot) : "";
  string fullFolder = os::pathJoin(datasetRoot, folder);
  if (!os::isDir(fullFolder)) {
    RS_LOGE("No folder at '{}'", fullFolder);
    return FILE_NOT_FOUND;
  }
  vector<string> files;
  IF_ERROR_LOG_AND_RETURN(os::listFilesRecursively(fullFolder, files, extension));
  sort(files.begin(), files.end(), [](const string& left, const string& right) {
    return helpers::beforeFileName(left, right);
  });
  outRelativePaths.reserve(files.size());
  for (const string& file : files) {
    outRelativePaths.push_back(folder.empty() ? file : os::pathJoin(folder, file));
  }
  return SUCCESS;
}

} // namespace reshard
