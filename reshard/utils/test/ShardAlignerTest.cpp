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

#include <gtest/gtest.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/Strings.h>
#include <reshard/os/Utils.h>
#include <reshard/test/helpers/DatasetTestsHelpers.h>
#include <reshard/utils/DataFilesUpdater.h>
#include <reshard/utils/ShardAligner.h>

using namespace std;
using namespace reshard;
using namespace reshard::test;
using namespace reshard::utils;

namespace {

struct ShardAlignerTest : testing::Test {
  void SetUp() override {
    sourcePath = getTestDatasetPath("align_source");
    outputPath = getTestDatasetPath("aligned");
    ASSERT_EQ(createSyntheticDataset(sourcePath, config, source), 0);
  }
  void TearDown() override {
    os::removeAll(sourcePath);
    os::removeAll(outputPath);
  }

  // Nothing at the output path, and no staging folder left behind.
  void expectNoOutput() const {
    EXPECT_FALSE(os::pathExists(outputPath));
    expectNoStagingFolder();
  }
  void expectNoStagingFolder() const {
    string hiddenPrefix = '.' + os::getFilename(outputPath);
    for (const string& name : os::listDir(os::getParentFolder(outputPath))) {
      EXPECT_FALSE(helpers::startsWith(name, hiddenPrefix)) << name;
    }
  }

  SyntheticDatasetConfig config;
  string sourcePath;
  string outputPath;
  DatasetPtr source;
};

} // namespace

TEST_F(ShardAlignerTest, alignToFirstVideo) {
  DatasetPtr aligned;
  AlignReport report;
  ASSERT_EQ(alignShards(source, outputPath, {}, aligned, report), 0);
  ASSERT_TRUE(aligned);
  EXPECT_EQ(report.referenceVideoKey, kFrontCamera);
  EXPECT_EQ(report.shardCount, 4);
  EXPECT_TRUE(report.hasDivergences());
  EXPECT_EQ(report.divergentEpisodeCounts, (map<string, uint32_t>{{kWristCamera, 9}}));

  EXPECT_EQ(aligned->getRoot(), outputPath);
  EXPECT_EQ(aligned->getEpisodeCount(), source->getEpisodeCount());
  EXPECT_EQ(aligned->getFrameCount(), source->getFrameCount());
  EXPECT_EQ(aligned->getInfo().totalTasks, source->getInfo().totalTasks);
  EXPECT_EQ(aligned->getFps(), source->getFps());
  EXPECT_TRUE(aligned->getInfo().dataFiles.empty());

  vector<FrameRecord> sourceFrames;
  vector<FrameRecord> alignedFrames;
  for (uint32_t k = 0; k < source->getEpisodeCount(); k++) {
    const EpisodeRecord& before = *source->getEpisode(k);
    const EpisodeRecord& after = *aligned->getEpisode(k);
    const ShardCoordinate& reference = after.findVideo(kFrontCamera)->coordinate;
    EXPECT_EQ(after.dataCoordinate, reference);
    EXPECT_EQ(after.metaCoordinate, reference);
    EXPECT_EQ(after.datasetFromIndex, before.datasetFromIndex);
    EXPECT_EQ(after.datasetToIndex, before.datasetToIndex);
    EXPECT_EQ(after.tasks, before.tasks);
    // videos are untouched
    EXPECT_EQ(after.videos, before.videos);
    ASSERT_EQ(source->readEpisodeFrames(k, sourceFrames), 0);
    ASSERT_EQ(aligned->readEpisodeFrames(k, alignedFrames), 0);
    EXPECT_EQ(alignedFrames, sourceFrames);
  }

  // data & meta/episodes shards match the reference video shards
  const ShardManifest& manifest = aligned->getManifest();
  vector<ShardDescriptor> dataShards;
  vector<ShardDescriptor> episodesShards;
  vector<ShardDescriptor> videoShards;
  ASSERT_EQ(manifest.listShards(kDataStore, dataShards), 0);
  ASSERT_EQ(manifest.listShards(kEpisodesStore, episodesShards), 0);
  ASSERT_EQ(manifest.listShards(videoStoreId(kFrontCamera), videoShards), 0);
  ASSERT_EQ(dataShards.size(), 4);
  ASSERT_EQ(episodesShards.size(), 4);
  ASSERT_EQ(videoShards.size(), 4);
  for (size_t s = 0; s < dataShards.size(); s++) {
    EXPECT_EQ(dataShards[s].coordinate, videoShards[s].coordinate);
    EXPECT_EQ(dataShards[s].fromIndex, videoShards[s].fromIndex);
    EXPECT_EQ(dataShards[s].toIndex, videoShards[s].toIndex);
    EXPECT_EQ(episodesShards[s].coordinate, videoShards[s].coordinate);
    EXPECT_TRUE(os::isFile(aligned->getPath(dataShards[s].path)));
  }
  EXPECT_EQ(dataShards[3].path, "data/chunk-001/file-000.parquet");

  // every video shard was copied, and the manifest was persisted
  for (const string& key : aligned->getVideoKeys()) {
    ASSERT_EQ(manifest.listShards(videoStoreId(key), videoShards), 0);
    for (const ShardDescriptor& shard : videoShards) {
      EXPECT_EQ(os::getFileSize(aligned->getPath(shard.path)), shard.byteSize);
      EXPECT_GT(shard.byteSize, 0);
    }
  }
  EXPECT_TRUE(os::isFile(aligned->getPath(ShardManifest::kManifestJsonPath)));
  EXPECT_TRUE(os::isFile(aligned->getPath("meta/tasks.jsonl")));
  expectNoStagingFolder();

  // the source wasn't modified
  EXPECT_FALSE(os::pathExists(source->getPath(ShardManifest::kManifestJsonPath)));
  EXPECT_EQ(source->getManifest().getShardCount(kDataStore), 3);
}

TEST_F(ShardAlignerTest, alignToOtherVideo) {
  AlignOptions options;
  options.referenceVideoKey = kWristCamera;
  options.copyMetaFiles = false;
  DatasetPtr aligned;
  AlignReport report;
  ASSERT_EQ(alignShards(source, outputPath, options, aligned, report), 0);
  EXPECT_EQ(report.referenceVideoKey, kWristCamera);
  EXPECT_EQ(report.shardCount, 6);
  EXPECT_EQ(report.divergentEpisodeCounts, (map<string, uint32_t>{{kFrontCamera, 9}}));
  for (const EpisodeRecord& episode : aligned->getEpisodes()) {
    EXPECT_EQ(episode.dataCoordinate, episode.findVideo(kWristCamera)->coordinate);
  }
  EXPECT_FALSE(os::pathExists(aligned->getPath("meta/tasks.jsonl")));
}

TEST_F(ShardAlignerTest, alreadyAligned) {
  SyntheticDatasetConfig alignedConfig;
  alignedConfig.videoKeys = {kFrontCamera};
  alignedConfig.dataEpisodesPerFile = 3;
  alignedConfig.metaEpisodesPerFile = 3;
  alignedConfig.videoEpisodesPerFile = {3};
  string path = getTestDatasetPath("already_aligned");
  DatasetPtr dataset;
  ASSERT_EQ(createSyntheticDataset(path, alignedConfig, dataset), 0);
  DatasetPtr aligned;
  AlignReport report;
  ASSERT_EQ(alignShards(dataset, outputPath, {}, aligned, report), 0);
  EXPECT_FALSE(report.hasDivergences());
  EXPECT_EQ(aligned->getEpisodes(), dataset->getEpisodes());
  EXPECT_TRUE(aligned->getManifest().hasSamePartition(dataset->getManifest()));
  os::removeAll(path);
}

TEST_F(ShardAlignerTest, videosPassThrough) {
  AlignOptions options;
  options.copyVideos = false;
  DatasetPtr aligned;
  AlignReport report;
  ASSERT_EQ(alignShards(source, outputPath, options, aligned, report), 0);
  ASSERT_TRUE(aligned);
  EXPECT_EQ(report.shardCount, 4);
  EXPECT_FALSE(os::pathExists(aligned->getPath("videos")));
  expectNoStagingFolder();

  for (uint32_t k = 0; k < source->getEpisodeCount(); k++) {
    const EpisodeRecord& after = *aligned->getEpisode(k);
    EXPECT_EQ(after.dataCoordinate, after.findVideo(kFrontCamera)->coordinate);
    EXPECT_EQ(after.metaCoordinate, after.dataCoordinate);
    EXPECT_EQ(after.videos, source->getEpisode(k)->videos);
  }
  // the video stores are described, but their files are left to the caller
  const ShardManifest& manifest = aligned->getManifest();
  EXPECT_EQ(manifest.getShardCount(kDataStore), 4);
  EXPECT_EQ(manifest.getShardCount(kEpisodesStore), 4);
  for (const string& key : source->getVideoKeys()) {
    vector<ShardDescriptor> sourceShards;
    vector<ShardDescriptor> videoShards;
    ASSERT_EQ(source->getManifest().listShards(videoStoreId(key), sourceShards), 0);
    ASSERT_EQ(manifest.listShards(videoStoreId(key), videoShards), 0);
    ASSERT_EQ(videoShards.size(), sourceShards.size());
    for (size_t s = 0; s < videoShards.size(); s++) {
      EXPECT_EQ(videoShards[s].coordinate, sourceShards[s].coordinate);
      EXPECT_EQ(videoShards[s].fromIndex, sourceShards[s].fromIndex);
      EXPECT_EQ(videoShards[s].toIndex, sourceShards[s].toIndex);
      EXPECT_EQ(videoShards[s].byteSize, -1);
    }
  }
  ShardLocation location;
  ASSERT_EQ(manifest.resolve(kDataStore, GlobalIndex(20), location), 0);
  EXPECT_EQ(location.coordinate, aligned->getEpisode(3)->dataCoordinate);
  EXPECT_EQ(location.localOffset, 4);
}

TEST_F(ShardAlignerTest, dataFilesListUpdated) {
  vector<string> dataFiles;
  ASSERT_EQ(updateInfoWithDataFiles(sourcePath, dataFiles), 0);
  ASSERT_EQ(dataFiles.size(), 3);
  Dataset::OpenOptions openOptions;
  openOptions.backends = getTestBackends();
  ASSERT_EQ(Dataset::open(sourcePath, source, openOptions), 0);
  ASSERT_EQ(source->getInfo().dataFiles, dataFiles);

  DatasetPtr aligned;
  AlignReport report;
  ASSERT_EQ(alignShards(source, outputPath, {}, aligned, report), 0);
  EXPECT_EQ(
      aligned->getInfo().dataFiles,
      vector<string>(
          {"data/chunk-000/file-000.parquet",
           "data/chunk-000/file-001.parquet",
           "data/chunk-000/file-002.parquet",
           "data/chunk-001/file-000.parquet"}));
}

TEST_F(ShardAlignerTest, failures) {
  AlignOptions options;
  options.referenceVideoKey = "observation.images.top";
  DatasetPtr aligned;
  AlignReport report;
  EXPECT_EQ(alignShards(source, outputPath, options, aligned, report), MISSING_VIDEO_STREAM);
  EXPECT_FALSE(aligned);
  expectNoOutput();

  ASSERT_EQ(os::makeDirectories(outputPath), 0);
  EXPECT_EQ(alignShards(source, outputPath, {}, aligned, report), INVALID_PARAMETER);
  EXPECT_FALSE(aligned);
  EXPECT_TRUE(os::listDir(outputPath).empty());
  ASSERT_EQ(os::removeAll(outputPath), 0);

  SyntheticDatasetConfig noVideoConfig;
  noVideoConfig.videoKeys.clear();
  string path = getTestDatasetPath("no_video");
  DatasetPtr noVideo;
  ASSERT_EQ(createSyntheticDataset(path, noVideoConfig, noVideo), 0);
  EXPECT_EQ(alignShards(noVideo, outputPath, {}, aligned, report), MISSING_VIDEO_STREAM);
  expectNoOutput();
  os::removeAll(path);
}

TEST_F(ShardAlignerTest, cancellation) {
  for (uint32_t notifications : {0, 2, 5, 9}) {
    CancellingLogger logger(notifications);
    DatasetPtr aligned;
    AlignReport report;
    EXPECT_EQ(
        alignShards(source, outputPath, {}, aligned, report, &logger), OPERATION_CANCELLED);
    EXPECT_TRUE(logger.wasCancelled());
    EXPECT_FALSE(aligned);
    expectNoOutput();
  }
}
