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

#include <reshard/Coordinates.h>
#include <reshard/DatasetLayout.h>

namespace reshard {

using std::map;
using std::string;
using std::vector;

/// Half-open range of global indexes.
struct IndexRange {
  GlobalIndex from;
  GlobalIndex to;

  uint64_t size() const {
    return to.distanceFrom(from);
  }
  bool operator==(const IndexRange& rhs) const {
    return from == rhs.from && to == rhs.to;
  }
};

/// One shard of one store, and the half-open range of global indexes of the frames it covers.
struct ShardDescriptor {
  ShardCoordinate coordinate;
  GlobalIndex fromIndex;
  GlobalIndex toIndex;
  /// Video stores only: sorted ranges of episodes inside [fromIndex, toIndex) without a stream
  /// for the video key, so without frames in the shard.
  vector<IndexRange> gaps;
  /// Frame rows for the data store, episode rows for the meta/episodes store,
  /// encoded frames for video stores.
  uint64_t rowCount{0};
  /// -1 when unknown
  int64_t byteSize{-1};
  /// relative to the dataset root
  string path;

  bool contains(GlobalIndex index) const {
    if (index < fromIndex || index >= toIndex) {
      return false;
    }
    for (const IndexRange& gap : gaps) {
      if (index < gap.from) {
        break;
      }
      if (index < gap.to) {
        return false;
      }
    }
    return true;
  }
  /// Position of a contained index among the frames of the shard.
  uint64_t localOffset(GlobalIndex index) const {
    uint64_t offset = index.distanceFrom(fromIndex);
    for (const IndexRange& gap : gaps) {
      if (index < gap.from) {
        break;
      }
      offset -= gap.size();
    }
    return offset;
  }
  bool operator==(const ShardDescriptor& rhs) const {
    return coordinate == rhs.coordinate && fromIndex == rhs.fromIndex &&
        toIndex == rhs.toIndex && gaps == rhs.gaps && rowCount == rhs.rowCount &&
        byteSize == rhs.byteSize && path == rhs.path;
  }
};

/// Where a global index lives within a store.
struct ShardLocation {
  ShardCoordinate coordinate;
  /// Row of the frame within the shard file (for video stores: the frame's position among the
  /// encoded frames of the shard).
  uint64_t localOffset{0};
  /// relative to the dataset root
  string path;
};

/// \brief Explicit list of which shard holds which global index range, for every store.
///
/// Built with one scan over the per-episode boundary records. For each store, shards partition
/// the global index space into monotonic, non-overlapping ranges. The data and meta/episodes
/// stores cover every frame without gaps. Video stores have gaps where episodes have no stream
/// for that video key, between shards or inside them.
/// A manifest is never patched: after any rewrite, a new one is built.
/// All const methods are safe to call from any number of threads.
class ShardManifest {
 public:
  static constexpr const char* kManifestJsonPath = "meta/manifest.json";

  ShardManifest() = default;

  /// Build the manifest of a dataset from its episodes.
  /// @param episodes: all the episodes of the dataset, in episode index order.
  /// @param layout: to generate the shard paths.
  /// @param datasetRoot: if not empty, used to get the shard file sizes.
  /// @return 0 on success, NON_CONTIGUOUS_GLOBAL_INDEX if episodes don't partition the global
  /// index space, or SHARD_CONSISTENCY_ERROR if a store's coordinates aren't monotonic, for
  /// instance, when a shard reappears after another shard.
  int build(
      const vector<EpisodeRecord>& episodes,
      const DatasetLayout& layout,
      const string& datasetRoot = {});

  /// Find which shard of a store holds a global index. O(log(shard count)).
  /// @return 0 on success, SHARD_NOT_FOUND for an unknown store, INVALID_RANGE if no shard of the
  /// store holds that index.
  int resolve(const string& storeId, GlobalIndex index, ShardLocation& outLocation) const;

  /// Get the ordered list of shards of a store.
  /// @return 0 on success, SHARD_NOT_FOUND for an unknown store.
  int listShards(const string& storeId, vector<ShardDescriptor>& outShards) const;

  /// Ids of the stores, sorted.
  vector<string> getStoreIds() const;

  size_t getShardCount(const string& storeId) const;

  string toJson() const;
  /// Parse & validate a manifest.
  /// @return 0 on success, INVALID_DISK_DATA for invalid json, or a shard consistency error.
  int fromJson(const string& jsonText);

  /// Read/write <datasetRoot>/meta/manifest.json
  int writeToDataset(const string& datasetRoot) const;
  int readFromDataset(const string& datasetRoot);

  /// Tell if two manifests describe the same stores, shards and ranges, ignoring the byte sizes.
  bool hasSamePartition(const ShardManifest& rhs) const;

  bool operator==(const ShardManifest& rhs) const {
    return stores_ == rhs.stores_;
  }

 private:
  static int validateStore(const string& storeId, const vector<ShardDescriptor>& shards);

  map<string, vector<ShardDescriptor>> stores_;
};

} // namespace reshard
