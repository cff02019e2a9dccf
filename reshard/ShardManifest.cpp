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

#include <reshard/ShardManifest.h>

#include <algorithm>

#define DEFAULT_LOG_CHANNEL "ShardManifest"
#include <logging/Log.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/helpers/Rapidjson.hpp>
#include <reshard/os/Utils.h>

using namespace std;

namespace {

const char* kStores = "stores";
const char* kChunkIndex = "chunk_index";
const char* kFileIndex = "file_index";
const char* kFromIndex = "from_index";
const char* kToIndex = "to_index";
const char* kRowCount = "row_count";
const char* kByteSize = "byte_size";
const char* kPath = "path";
const char* kGaps = "gaps";

// The data & meta/episodes stores cover every frame, video stores may skip episodes
bool isGapFreeStore(const string& storeId) {
  return storeId == reshard::kDataStore || storeId == reshard::kEpisodesStore;
}

} // namespace

namespace reshard {

namespace {

int addToStore(
    const string& storeId,
    vector<ShardDescriptor>& shards,
    const ShardCoordinate& coordinate,
    const EpisodeRecord& episode,
    uint64_t rowCount,
    const DatasetLayout& layout,
    const string& datasetRoot) {
  if (!shards.empty()) {
    ShardDescriptor& last = shards.back();
    if (last.coordinate == coordinate) {
      // episodes without this video key leave gaps in video shards
      if (last.toIndex < episode.datasetFromIndex && !isGapFreeStore(storeId)) {
        last.gaps.push_back({last.toIndex, episode.datasetFromIndex});
      } else if (last.toIndex != episode.datasetFromIndex) {
        RS_LOGE(
            "Store '{}': shard {} holds episode {}, but not the episodes right before it.",
            storeId,
            coordinate.toString(),
            episode.episodeIndex);
        return SHARD_CONSISTENCY_ERROR;
      }
      last.toIndex = episode.datasetToIndex;
      last.rowCount += rowCount;
      return SUCCESS;
    }
    if (!(last.coordinate < coordinate)) {
      RS_LOGE(
          "Store '{}': episode {} is in shard {}, which comes after shard {}.",
          storeId,
          episode.episodeIndex,
          coordinate.toString(),
          last.coordinate.toString());
      return SHARD_CONSISTENCY_ERROR;
    }
  }
  ShardDescriptor shard;
  shard.coordinate = coordinate;
  shard.fromIndex = episode.datasetFromIndex;
  shard.toIndex = episode.datasetToIndex;
  shard.rowCount = rowCount;
  shard.path = layout.storeFilePath(storeId, coordinate);
  if (!datasetRoot.empty()) {
    shard.byteSize = os::getFileSize(os::pathJoin(datasetRoot, shard.path));
  }
  shards.emplace_back(std::move(shard));
  return SUCCESS;
}

} // namespace

int ShardManifest::build(
    const vector<EpisodeRecord>& episodes,
    const DatasetLayout& layout,
    const string& datasetRoot) {
  stores_.clear();
  map<string, vector<ShardDescriptor>> stores;
  vector<ShardDescriptor>& dataShards = stores[kDataStore];
  vector<ShardDescriptor>& episodesShards = stores[kEpisodesStore];
  for (size_t index = 0; index < episodes.size(); ++index) {
    const EpisodeRecord& episode = episodes[index];
    if (episode.episodeIndex != index) {
      RS_LOGE("Episode #{} has index {}.", index, episode.episodeIndex);
      return SHARD_CONSISTENCY_ERROR;
    }
    if (episode.datasetToIndex < episode.datasetFromIndex ||
        episode.datasetToIndex.distanceFrom(episode.datasetFromIndex) != episode.length) {
      RS_LOGE(
          "Episode {} has {} frames, but covers the range [{}, {}).",
          index,
          episode.length,
          episode.datasetFromIndex.value(),
          episode.datasetToIndex.value());
      return SHARD_CONSISTENCY_ERROR;
    }
    if (index > 0 && episode.datasetFromIndex != episodes[index - 1].datasetToIndex) {
      RS_LOGE(
          "Episode {} starts at global index {}, but episode {} ends at {}.",
          index,
          episode.datasetFromIndex.value(),
          index - 1,
          episodes[index - 1].datasetToIndex.value());
      return NON_CONTIGUOUS_GLOBAL_INDEX;
    }
    IF_ERROR_RETURN(addToStore(
        kDataStore,
        dataShards,
        episode.dataCoordinate,
        episode,
        episode.length,
        layout,
        datasetRoot));
    IF_ERROR_RETURN(addToStore(
        kEpisodesStore, episodesShards, episode.metaCoordinate, episode, 1, layout, datasetRoot));
    for (const auto& video : episode.videos) {
      string storeId = videoStoreId(video.first);
      IF_ERROR_RETURN(addToStore(
          storeId,
          stores[storeId],
          video.second.coordinate,
          episode,
          episode.length,
          layout,
          datasetRoot));
    }
  }
  stores_.swap(stores);
  return SUCCESS;
}

int ShardManifest::resolve(const string& storeId, GlobalIndex index, ShardLocation& outLocation)
    const {
  auto store = stores_.find(storeId);
  if (store == stores_.end()) {
    return SHARD_NOT_FOUND;
  }
  const vector<ShardDescriptor>& shards = store->second;
  // first shard starting after index, then step back
  auto iter = upper_bound(
      shards.begin(), shards.end(), index, [](GlobalIndex value, const ShardDescriptor& shard) {
        return value < shard.fromIndex;
      });
  if (iter == shards.begin() || !(--iter)->contains(index)) {
    return INVALID_RANGE;
  }
  outLocation.coordinate = iter->coordinate;
  outLocation.localOffset = iter->localOffset(index);
  outLocation.path = iter->path;
  return SUCCESS;
}

int ShardManifest::listShards(const string& storeId, vector<ShardDescriptor>& outShards) const {
  auto store = stores_.find(storeId);
  if (store == stores_.end()) {
    outShards.clear();
    return SHARD_NOT_FOUND;
  }
  outShards = store->second;
  return SUCCESS;
}

vector<string> ShardManifest::getStoreIds() const {
  vector<string> ids;
  ids.reserve(stores_.size());
  for (const auto& store : stores_) {
    ids.push_back(store.first);
  }
  return ids;
}

size_t ShardManifest::getShardCount(const string& storeId) const {
  auto store = stores_.find(storeId);
  return store != stores_.end() ? store->second.size() : 0;
}

bool ShardManifest::hasSamePartition(const ShardManifest& rhs) const {
  if (stores_.size() != rhs.stores_.size()) {
    return false;
  }
  for (const auto& store : stores_) {
    auto other = rhs.stores_.find(store.first);
    if (other == rhs.stores_.end() || other->second.size() != store.second.size()) {
      return false;
    }
    for (size_t index = 0; index < store.second.size(); ++index) {
      const ShardDescriptor& left = store.second[index];
      const ShardDescriptor& right = other->second[index];
      if (left.coordinate != right.coordinate || left.fromIndex != right.fromIndex ||
          left.toIndex != right.toIndex || left.gaps != right.gaps ||
          left.rowCount != right.rowCount) {
        return false;
      }
    }
  }
  return true;
}

int ShardManifest::validateStore(const string& storeId, const vector<ShardDescriptor>& shards) {
  for (size_t index = 0; index < shards.size(); ++index) {
    const ShardDescriptor& shard = shards[index];
    if (shard.toIndex < shard.fromIndex) {
      RS_LOGE("Store '{}': shard {} has an invalid range.", storeId, shard.coordinate.toString());
      return SHARD_CONSISTENCY_ERROR;
    }
    if (!shard.gaps.empty() && isGapFreeStore(storeId)) {
      RS_LOGE("Store '{}' can't have gaps.", storeId);
      return NON_CONTIGUOUS_GLOBAL_INDEX;
    }
    GlobalIndex gapsStart = shard.fromIndex;
    for (const IndexRange& gap : shard.gaps) {
      // gaps are sorted, non-empty, and strictly inside the shard's range
      if (gap.from <= gapsStart || gap.to <= gap.from || gap.to >= shard.toIndex) {
        RS_LOGE(
            "Store '{}': shard {} has an invalid gap [{}, {}).",
            storeId,
            shard.coordinate.toString(),
            gap.from.value(),
            gap.to.value());
        return SHARD_CONSISTENCY_ERROR;
      }
      gapsStart = gap.to;
    }
    if (index == 0) {
      continue;
    }
    const ShardDescriptor& previous = shards[index - 1];
    if (!(previous.coordinate < shard.coordinate) || shard.fromIndex < previous.toIndex) {
      RS_LOGE(
          "Store '{}': shards {} and {} are out of order or overlap.",
          storeId,
          previous.coordinate.toString(),
          shard.coordinate.toString());
      return SHARD_CONSISTENCY_ERROR;
    }
    if (isGapFreeStore(storeId) && shard.fromIndex != previous.toIndex) {
      RS_LOGE(
          "Store '{}': gap between global index {} and {}.",
          storeId,
          previous.toIndex.value(),
          shard.fromIndex.value());
      return NON_CONTIGUOUS_GLOBAL_INDEX;
    }
  }
  return SUCCESS;
}

string ShardManifest::toJson() const {
  using namespace reshard_rapidjson;
  JDocument document;
  JsonWrapper wrapper{document};
  JValue jstores(kObjectType);
  for (const auto& store : stores_) {
    JValue jshards(kArrayType);
    for (const ShardDescriptor& shard : store.second) {
      JValue jshard(kObjectType);
      JsonWrapper shardWrapper{jshard, wrapper.alloc};
      shardWrapper.addMember(kChunkIndex, shard.coordinate.chunkIndex);
      shardWrapper.addMember(kFileIndex, shard.coordinate.fileIndex);
      shardWrapper.addMember(kFromIndex, shard.fromIndex.value());
      shardWrapper.addMember(kToIndex, shard.toIndex.value());
      shardWrapper.addMember(kRowCount, shard.rowCount);
      shardWrapper.addMember(kByteSize, shard.byteSize);
      shardWrapper.addMember(kPath, shard.path);
      if (!shard.gaps.empty()) {
        JValue jgaps(kArrayType);
        for (const IndexRange& gap : shard.gaps) {
          JValue jgap(kArrayType);
          jgap.PushBack(gap.from.value(), wrapper.alloc);
          jgap.PushBack(gap.to.value(), wrapper.alloc);
          jgaps.PushBack(jgap, wrapper.alloc);
        }
        shardWrapper.addMember(kGaps, jgaps);
      }
      jshards.PushBack(jshard, wrapper.alloc);
    }
    jstores.AddMember(wrapper.jValue(store.first), jshards, wrapper.alloc);
  }
  wrapper.addMember(kStores, jstores);
  return jDocumentToJsonStringPretty(document);
}

int ShardManifest::fromJson(const string& jsonText) {
  using namespace reshard_rapidjson;
  stores_.clear();
  JDocument document;
  if (!jParse(document, jsonText) || !document.IsObject()) {
    RS_LOGE("Can't parse shard manifest: {}", jParseErrorMessage(document));
    return INVALID_DISK_DATA;
  }
  const JValue::ConstMemberIterator jstores = document.FindMember(kStores);
  if (jstores == document.MemberEnd() || !jstores->value.IsObject()) {
    RS_LOGE("Shard manifest has no '{}' object.", kStores);
    return INVALID_DISK_DATA;
  }
  map<string, vector<ShardDescriptor>> stores;
  for (auto store = jstores->value.MemberBegin(); store != jstores->value.MemberEnd(); ++store) {
    string storeId = store->name.GetString();
    if (!store->value.IsArray()) {
      RS_LOGE("Shard manifest store '{}' isn't an array.", storeId);
      return INVALID_DISK_DATA;
    }
    vector<ShardDescriptor>& shards = stores[storeId];
    for (const JValue& jshard : store->value.GetArray()) {
      ShardDescriptor shard;
      int64_t fromIndex = 0;
      int64_t toIndex = 0;
      int64_t rowCount = 0;
      if (!jshard.IsObject() || !getJUInt32(shard.coordinate.chunkIndex, jshard, kChunkIndex) ||
          !getJUInt32(shard.coordinate.fileIndex, jshard, kFileIndex) ||
          !getJInt64(fromIndex, jshard, kFromIndex) || !getJInt64(toIndex, jshard, kToIndex) ||
          !getJInt64(rowCount, jshard, kRowCount) ||
          !getJInt64(shard.byteSize, jshard, kByteSize) || !getJString(shard.path, jshard, kPath) ||
          fromIndex < 0 || toIndex < 0 || rowCount < 0) {
        RS_LOGE("Invalid shard description in store '{}'.", storeId);
        return INVALID_DISK_DATA;
      }
      shard.fromIndex = GlobalIndex(static_cast<uint64_t>(fromIndex));
      shard.toIndex = GlobalIndex(static_cast<uint64_t>(toIndex));
      shard.rowCount = static_cast<uint64_t>(rowCount);
      const JValue::ConstMemberIterator jgaps = jshard.FindMember(kGaps);
      if (jgaps != jshard.MemberEnd()) {
        if (!jgaps->value.IsArray()) {
          RS_LOGE("Invalid gaps in store '{}'.", storeId);
          return INVALID_DISK_DATA;
        }
        for (const JValue& jgap : jgaps->value.GetArray()) {
          if (!jgap.IsArray() || jgap.Size() != 2 || !jgap[0].IsUint64() ||
              !jgap[1].IsUint64()) {
            RS_LOGE("Invalid gap in store '{}'.", storeId);
            return INVALID_DISK_DATA;
          }
          shard.gaps.push_back(
              {GlobalIndex(jgap[0].GetUint64()), GlobalIndex(jgap[1].GetUint64())});
        }
      }
      shards.emplace_back(std::move(shard));
    }
    IF_ERROR_RETURN(validateStore(storeId, shards));
  }
  stores_.swap(stores);
  return SUCCESS;
}

int ShardManifest::writeToDataset(const string& datasetRoot) const {
  string path = os::pathJoin(datasetRoot, kManifestJsonPath);
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(os::getParentFolder(path)));
  IF_ERROR_LOG_AND_RETURN(os::writeTextFile(path, toJson()));
  return SUCCESS;
}

int ShardManifest::readFromDataset(const string& datasetRoot) {
  string path = os::pathJoin(datasetRoot, kManifestJsonPath);
  string jsonText;
  IF_ERROR_LOG_AND_RETURN(os::readTextFile(path, jsonText));
  return fromJson(jsonText);
}

} // namespace reshard
