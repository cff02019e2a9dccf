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

#include <reshard/BackendFactory.h>
#include <reshard/DatasetInfo.h>
#include <reshard/ShardManifest.h>

namespace reshard {

using std::string;
using std::vector;

class Dataset;

/// \brief Writes a new dataset in a hidden staging folder next to its final location, then
/// publishes it atomically, by renaming the staging folder.
///
/// Until publish() succeeds, nothing is visible at the output path, and destroying the writer
/// deletes the staging folder, so that failed or cancelled operations leave no trace.
/// Shard files may be written concurrently, as long as they're different files.
class DatasetWriter {
 public:
  DatasetWriter(const string& outputPath, const Backends& backends);
  ~DatasetWriter();

  DatasetWriter(const DatasetWriter&) = delete;
  DatasetWriter& operator=(const DatasetWriter&) = delete;

  /// Create the staging folder.
  /// @return 0 on success, INVALID_PARAMETER if something already exists at the output path.
  int create();

  const string& getOutputPath() const {
    return outputPath_;
  }
  const string& getStagingPath() const {
    return stagingPath_;
  }
  /// Absolute path of a file in the staging folder.
  string getStagedPath(const string& relativePath) const;

  int writeFrames(const string& relativePath, const vector<FrameRecord>& frames);
  int writeEpisodes(const string& relativePath, const vector<EpisodeRecord>& episodes);
  int encodeVideo(
      const string& relativePath,
      const vector<VideoFrame>& frames,
      const VideoEncodeSettings& settings);
  /// Copy a file byte for byte.
  int copyFile(const string& sourcePath, const string& relativePath);
  /// Copy the files directly in the source's meta folder, such as tasks & stats,
  /// except the dataset info and the manifest, which are always regenerated.
  int copyMetaFiles(const Dataset& source);

  int writeInfo(const DatasetInfo& info);
  int writeManifest(const ShardManifest& manifest);

  /// Move the staging folder to the output path. After this, the writer won't delete anything.
  /// @return 0 on success, INVALID_PARAMETER if something appeared at the output path.
  int publish();
  bool isPublished() const {
    return published_;
  }

 private:
  int makeParentFolder(const string& absolutePath);

  const string outputPath_;
  const Backends backends_;
  string stagingPath_;
  bool published_{false};
};

} // namespace reshard
