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

#include <cmath>
#include <limits>

#include <reshard/ErrorCode.h>
#include <reshard/TimestampResolver.h>

using namespace std;
using namespace reshard;

namespace {

const char* kFront = "observation.images.front";
const char* kWrist = "observation.images.wrist";

VideoSpan makeSpan(uint32_t file, double from, double to) {
  VideoSpan span;
  span.coordinate = {0, file};
  span.fromTimestamp = SeekTime(from);
  span.toTimestamp = SeekTime(to);
  return span;
}

struct TimestampResolverTest : testing::Test {
  void SetUp() override {
    // 320 episodes, of 10 frames at 10 fps, 16 episodes per file, except episode 318.
    GlobalIndex nextIndex{0};
    for (uint32_t k = 0; k < 320; k++) {
      EpisodeRecord episode;
      episode.episodeIndex = k;
      episode.length = 10;
      episode.datasetFromIndex = nextIndex;
      episode.datasetToIndex = nextIndex.advancedBy(episode.length);
      double from = (k % 16) * 1.0;
      episode.videos[kFront] = makeSpan(k / 16, from, from + 1);
      episode.videos[kWrist] = makeSpan(k / 8, (k % 8) * 1.0, (k % 8) * 1.0 + 1);
      nextIndex = episode.datasetToIndex;
      episodes.push_back(episode);
    }
    // an episode starting deep into its video file
    episodes[318].length = 145;
    episodes[318].videos[kFront] = makeSpan(19, 1448.85, 1463.35);
    // an episode with a single frame video
    episodes[5].videos[kWrist] = makeSpan(0, 7, 7);
    // an episode without wrist camera
    episodes[7].videos.erase(kWrist);
  }

  vector<EpisodeRecord> episodes;
};

} // namespace

TEST_F(TimestampResolverTest, episodeBoundaries) {
  TimestampResolver resolver(10, episodes);
  for (uint32_t k = 0; k < episodes.size(); k++) {
    for (const auto& video : episodes[k].videos) {
      ResolvedSeek seek;
      ASSERT_EQ(resolver.resolve(k, video.first, EpisodeTime(0), 0, seek), 0);
      EXPECT_DOUBLE_EQ(seek.seekTime.seconds(), video.second.fromTimestamp.seconds());
      EXPECT_FALSE(seek.isPadding);
      EpisodeTime end(video.second.duration());
      ASSERT_EQ(resolver.resolve(k, video.first, end, 0, seek), 0);
      EXPECT_EQ(seek.seekTime, video.second.toTimestamp);
      EXPECT_FALSE(seek.isPadding);
    }
  }
}

TEST_F(TimestampResolverTest, exactEndTimestamp) {
  // 0.12 + (1.57 - 0.12) isn't exactly 1.57
  episodes[2].videos[kFront] = makeSpan(0, 0.12, 1.57);
  ASSERT_NE(0.12 + (1.57 - 0.12), 1.57);
  TimestampResolver resolver(10, episodes);
  ResolvedSeek seek;
  ASSERT_EQ(resolver.resolve(2, kFront, EpisodeTime(1.57 - 0.12), 0, seek), 0);
  EXPECT_EQ(seek.seekTime, SeekTime(1.57));
  EXPECT_FALSE(seek.isPadding);
  ASSERT_EQ(resolver.resolve(2, kFront, EpisodeTime(0), 100, seek), 0);
  EXPECT_EQ(seek.seekTime, SeekTime(1.57));
  EXPECT_TRUE(seek.isPadding);
}

TEST_F(TimestampResolverTest, episodeInTheMiddleOfItsFile) {
  TimestampResolver resolver(10, episodes);
  ResolvedSeek seek;
  ASSERT_EQ(resolver.resolve(318, kFront, EpisodeTime::fromFrameIndex(0, 10), 0, seek), 0);
  EXPECT_DOUBLE_EQ(seek.seekTime.seconds(), 1448.85);
  EXPECT_FALSE(seek.isPadding);

  map<string, vector<ResolvedSeek>> seeks;
  ASSERT_EQ(resolver.resolveFrame(318, 0, {0, 5, -3}, {kFront}, seeks), 0);
  ASSERT_EQ(seeks.size(), 1);
  ASSERT_EQ(seeks[kFront].size(), 3);
  EXPECT_DOUBLE_EQ(seeks[kFront][0].seekTime.seconds(), 1448.85);
  EXPECT_NEAR(seeks[kFront][1].seekTime.seconds(), 1449.35, 1e-9);
  // clamped to the episode's start, not to the file's start
  EXPECT_DOUBLE_EQ(seeks[kFront][2].seekTime.seconds(), 1448.85);
  EXPECT_TRUE(seeks[kFront][2].isPadding);
  EXPECT_FALSE(seeks[kFront][1].isPadding);
}

TEST_F(TimestampResolverTest, clamping) {
  TimestampResolver resolver(10, episodes);
  ResolvedSeek maxInBounds;
  ResolvedSeek oversized;
  ResolvedSeek hugelyOversized;
  ASSERT_EQ(resolver.resolve(20, kFront, EpisodeTime(0.5), 5, maxInBounds), 0);
  ASSERT_EQ(resolver.resolve(20, kFront, EpisodeTime(0.5), 6, oversized), 0);
  ASSERT_EQ(resolver.resolve(20, kFront, EpisodeTime(0.5), 1e6, hugelyOversized), 0);
  EXPECT_NEAR(
      maxInBounds.seekTime.seconds(), episodes[20].videos[kFront].toTimestamp.seconds(), 1e-9);
  EXPECT_DOUBLE_EQ(oversized.seekTime.seconds(), maxInBounds.seekTime.seconds());
  EXPECT_DOUBLE_EQ(hugelyOversized.seekTime.seconds(), maxInBounds.seekTime.seconds());
  EXPECT_FALSE(maxInBounds.isPadding);
  EXPECT_TRUE(oversized.isPadding);

  // never wraps into the previous episode of the same file
  ResolvedSeek before;
  ASSERT_EQ(resolver.resolve(20, kFront, EpisodeTime(0), -1000, before), 0);
  EXPECT_DOUBLE_EQ(before.seekTime.seconds(), episodes[20].videos[kFront].fromTimestamp.seconds());
  EXPECT_TRUE(before.isPadding);
}

TEST_F(TimestampResolverTest, zeroDuration) {
  TimestampResolver resolver(10, episodes);
  map<string, vector<ResolvedSeek>> seeks;
  ASSERT_EQ(resolver.resolve(5, EpisodeTime(0.3), {-2, 0, 2}, {kWrist}, seeks), 0);
  for (const ResolvedSeek& seek : seeks[kWrist]) {
    EXPECT_DOUBLE_EQ(seek.seekTime.seconds(), 7);
  }
}

TEST_F(TimestampResolverTest, multipleKeys) {
  TimestampResolver resolver(10, episodes);
  map<string, vector<ResolvedSeek>> seeks;
  ASSERT_EQ(resolver.resolveFrame(25, 2, {0, 1}, {}, seeks), 0);
  ASSERT_EQ(seeks.size(), 2);
  // episode 25: 10th episode of front file 1, 2nd episode of wrist file 3
  EXPECT_NEAR(seeks[kFront][0].seekTime.seconds(), 9.2, 1e-9);
  EXPECT_NEAR(seeks[kFront][1].seekTime.seconds(), 9.3, 1e-9);
  EXPECT_NEAR(seeks[kWrist][0].seekTime.seconds(), 1.2, 1e-9);
  EXPECT_NEAR(seeks[kWrist][1].seekTime.seconds(), 1.3, 1e-9);

  // episode 7 has no wrist camera: only the front camera is resolved by default
  ASSERT_EQ(resolver.resolveFrame(7, 0, {0}, {}, seeks), 0);
  EXPECT_EQ(seeks.size(), 1);
  EXPECT_EQ(seeks.count(kFront), 1);
}

TEST_F(TimestampResolverTest, errors) {
  TimestampResolver resolver(10, episodes);
  map<string, vector<ResolvedSeek>> seeks;
  EXPECT_EQ(resolver.resolveFrame(320, 0, {0}, {}, seeks), EPISODE_NOT_FOUND);
  EXPECT_EQ(resolver.resolveFrame(7, 0, {0}, {kFront, kWrist}, seeks), MISSING_VIDEO_STREAM);
  EXPECT_TRUE(seeks.empty());
  EXPECT_EQ(
      resolver.resolveFrame(3, 0, {0}, {"observation.images.top"}, seeks), MISSING_VIDEO_STREAM);
  const double nan = numeric_limits<double>::quiet_NaN();
  const double inf = numeric_limits<double>::infinity();
  EXPECT_EQ(resolver.resolveFrame(3, 0, {0, nan}, {}, seeks), INVALID_TIME_OFFSET);
  EXPECT_EQ(resolver.resolve(3, EpisodeTime(inf), {0}, {}, seeks), INVALID_TIME_OFFSET);
  ResolvedSeek seek;
  EXPECT_EQ(resolver.resolve(3, kFront, EpisodeTime(0), -inf, seek), INVALID_TIME_OFFSET);
  EXPECT_EQ(resolver.resolve(3, kFront, EpisodeTime(nan), 0, seek), INVALID_TIME_OFFSET);
  EXPECT_TRUE(isCoordinateError(INVALID_TIME_OFFSET));
}

TEST_F(TimestampResolverTest, episodeFrames) {
  TimestampResolver resolver(10, episodes);
  vector<SeekTime> seekTimes;
  ASSERT_EQ(resolver.resolveEpisodeFrames(318, kFront, seekTimes), 0);
  ASSERT_EQ(seekTimes.size(), 145);
  EXPECT_DOUBLE_EQ(seekTimes.front().seconds(), 1448.85);
  EXPECT_NEAR(seekTimes.back().seconds(), 1448.85 + 14.4, 1e-9);
  EXPECT_EQ(resolver.resolveEpisodeFrames(7, kWrist, seekTimes), MISSING_VIDEO_STREAM);
  EXPECT_TRUE(seekTimes.empty());
}
