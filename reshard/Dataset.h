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

#include <memory>
#include <string>
#include <vector>

#include <reshard/BackendFactory.h>
#include <reshard/Coordinates.h>
#include <reshard/DatasetInfo.h>
#include <reshard/DatasetLayout.h>
#include <reshard/ShardManifest.h>
#include <reshard/TimestampResolver.h>

namespace reshard {

using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

class Dataset;
using DatasetPtr = shared_ptr<const Dataset>;

/// \brief Immutable snapshot of an episodic dataset: its info, its episodes and its manifest.
///
/// A dataset is opened once, and never modified afterwards. Realigning or shuffling a dataset
/// produces a new dataset at a different location. All methods are const & thread-safe.
class Dataset {
 public:
  struct OpenOptions {
    /// Backends to use. When not set, they're looked up in the BackendFactory.
    Backends backends;
    /// Names of the backends to look up, or empty for the default ones.
    string tableHandlerName;
    string videoCodecName;
  };

  /// Open a dataset.
  /// Reads meta/info.json, then meta/manifest.json when present, or lists meta/episodes/
  /// otherwise, reads every episode row, and builds the manifest if it wasn't persisted.
  /// @param root: path of the dataset's root folder.
  /// @param outDataset: on success, the dataset.
  /// @return 0 on success, or an error code.
  static int open(const string& root, DatasetPtr& outDataset, const OpenOptions& options = {});

  Dataset(const Dataset&) = delete;
  Dataset& operator=(const Dataset&) = delete;

  const string& getRoot() const {
    return root_;
  }
  const DatasetInfo& getInfo() const {
    return info_;
  }
  double getFps() const {
    return info_.fps;
  }
  const DatasetLayout& getLayout() const {
    return layout_;
  }
  const vector<EpisodeRecord>& getEpisodes() const {
    return episodes_;
  }
  uint32_t getEpisodeCount() const {
    return static_cast<uint32_t>(episodes_.size());
  }
  /// @return The episode, or nullptr if there is no such episode.
  const EpisodeRecord* getEpisode(uint32_t episodeIndex) const;
  uint64_t getFrameCount() const;
  /// Video keys, in the order of the dataset's features.
  vector<string> getVideoKeys() const {
    return info_.getVideoKeys();
  }
  const ShardManifest& getManifest() const {
    return manifest_;
  }
  const TimestampResolver& getResolver() const {
    return *resolver_;
  }
  const Backends& getBackends() const {
    return backends_;
  }

  /// Absolute path of a file of the dataset.
  string getPath(const string& relativePath) const;

  /// Find the episode holding a global index. O(log(episode count)).
  /// @return 0 on success, or FRAME_NOT_FOUND.
  int findEpisode(GlobalIndex index, uint32_t& outEpisodeIndex) const;

  /// Read all the frame rows of an episode, using the manifest to find them.
  /// @return 0 on success, EPISODE_NOT_FOUND, or a read error.
  int readEpisodeFrames(uint32_t episodeIndex, vector<FrameRecord>& outFrames) const;

 private:
  Dataset() = default;

  int readEpisodes(bool& outManifestRead);
  int checkEpisodes() const;

  string root_;
  DatasetInfo info_;
  DatasetLayout layout_;
  vector<EpisodeRecord> episodes_;
  ShardManifest manifest_;
  Backends backends_;
  unique_ptr<TimestampResolver> resolver_;
};

} // namespace reshard
