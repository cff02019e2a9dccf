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

#include <reshard/DatasetWriter.h>

#define DEFAULT_LOG_CHANNEL "DatasetWriter"
#include <logging/Checks.h>
#include <logging/Log.h>

#include <reshard/Dataset.h>
#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/os/Utils.h>

using namespace std;

namespace reshard {

DatasetWriter::DatasetWriter(const string& outputPath, const Backends& backends)
    : outputPath_{outputPath}, backends_{backends} {
  RS_CHECK_NOTNULL(backends_.tables);
  RS_CHECK_NOTNULL(backends_.video);
}

DatasetWriter::~DatasetWriter() {
  if (!published_ && !stagingPath_.empty() && os::pathExists(stagingPath_)) {
    RS_LOGD("Removing unpublished staging folder '{}'", stagingPath_);
    IF_ERROR_LOG(os::removeAll(stagingPath_));
  }
}

int DatasetWriter::create() {
  if (!stagingPath_.empty()) {
    RS_LOGE("Staging folder already created.");
    return INVALID_REQUEST;
  }
  if (outputPath_.empty() || os::pathExists(outputPath_)) {
    RS_LOGE("Can't create a dataset at '{}': the path is empty or exists already.", outputPath_);
    return INVALID_PARAMETER;
  }
  string parent = os::getParentFolder(outputPath_);
  string hiddenName = '.' + os::getFilename(outputPath_) + ".staging";
  string stagingPath =
      os::getUniquePath(parent.empty() ? hiddenName : os::pathJoin(parent, hiddenName));
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(stagingPath));
  stagingPath_ = stagingPath;
  return SUCCESS;
}

string DatasetWriter::getStagedPath(const string& relativePath) const {
  return os::pathJoin(stagingPath_, relativePath);
}

int DatasetWriter::makeParentFolder(const string& absolutePath) {
  if (stagingPath_.empty()) {
    RS_LOGE("Staging folder not created.");
    return INVALID_REQUEST;
  }
  return os::makeDirectories(os::getParentFolder(absolutePath));
}

int DatasetWriter::writeFrames(const string& relativePath, const vector<FrameRecord>& frames) {
  string path = getStagedPath(relativePath);
  IF_ERROR_RETURN(makeParentFolder(path));
  IF_ERROR_LOG_AND_RETURN(backends_.tables->writeFrames(path, frames));
  return SUCCESS;
}

int DatasetWriter::writeEpisodes(
    const string& relativePath,
    const vector<EpisodeRecord>& episodes) {
  string path = getStagedPath(relativePath);
  IF_ERROR_RETURN(makeParentFolder(path));
  IF_ERROR_LOG_AND_RETURN(backends_.tables->writeEpisodes(path, episodes));
  return SUCCESS;
}

int DatasetWriter::encodeVideo(
    const string& relativePath,
    const vector<VideoFrame>& frames,
    const VideoEncodeSettings& settings) {
  string path = getStagedPath(relativePath);
  IF_ERROR_RETURN(makeParentFolder(path));
  int status = backends_.video->encodeFrames(path, frames, settings);
  if (status != 0) {
    RS_LOGE("Can't encode '{}': {}", relativePath, errorCodeToMessage(status));
    return isMediaCodecError(status) ? status : MEDIA_ENCODE_ERROR;
  }
  return SUCCESS;
}

int DatasetWriter::copyFile(const string& sourcePath, const string& relativePath) {
  if (stagingPath_.empty()) {
    RS_LOGE("Staging folder not created.");
    return INVALID_REQUEST;
  }
  IF_ERROR_LOG_AND_RETURN(os::copyFile(sourcePath, getStagedPath(relativePath)));
  return SUCCESS;
}

int DatasetWriter::copyMetaFiles(const Dataset& source) {
  const string metaFolder = os::getParentFolder(DatasetInfo::kInfoJsonPath);
  for (const string& name : os::listDir(source.getPath(metaFolder))) {
    string relativePath = os::pathJoin(metaFolder, name);
    if (relativePath == DatasetInfo::kInfoJsonPath ||
        relativePath == ShardManifest::kManifestJsonPath ||
        !os::isFile(source.getPath(relativePath))) {
      continue;
    }
    IF_ERROR_RETURN(copyFile(source.getPath(relativePath), relativePath));
  }
  return SUCCESS;
}

int DatasetWriter::writeInfo(const DatasetInfo& info) {
  if (stagingPath_.empty()) {
    return INVALID_REQUEST;
  }
  return info.writeToDataset(stagingPath_);
}

int DatasetWriter::writeManifest(const ShardManifest& manifest) {
  if (stagingPath_.empty()) {
    return INVALID_REQUEST;
  }
  return manifest.writeToDataset(stagingPath_);
}

int DatasetWriter::publish() {
  if (stagingPath_.empty() || published_) {
    RS_LOGE("Nothing to publish.");
    return INVALID_REQUEST;
  }
  if (os::pathExists(outputPath_)) {
    RS_LOGE("Can't publish to '{}': the path exists already.", outputPath_);
    return INVALID_PARAMETER;
  }
  IF_ERROR_LOG_AND_RETURN(os::rename(stagingPath_, outputPath_));
  published_ = true;
  RS_LOGI("Published '{}'", outputPath_);
  return SUCCESS;
}

} // namespace reshard
