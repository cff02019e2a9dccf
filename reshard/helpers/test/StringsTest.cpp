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

#include <algorithm>

#include <reshard/helpers/Strings.h>

struct StringsHelpersTester : testing::Test {};

using namespace std;
using namespace reshard;

TEST_F(StringsHelpersTester, startsWith) {
  using namespace reshard::helpers;
  EXPECT_TRUE(startsWith("videos/observation.images.front", ""));
  EXPECT_TRUE(startsWith("videos/observation.images.front", "videos/"));
  EXPECT_FALSE(startsWith("videos/observation.images.front", "Videos/"));
  EXPECT_FALSE(startsWith("video", "videos/"));
  EXPECT_TRUE(startsWith("", ""));
  EXPECT_FALSE(startsWith("", "a"));
}

TEST_F(StringsHelpersTester, beforeFileName) {
  using namespace reshard::helpers;
  EXPECT_TRUE(beforeFileName("file-2.parquet", "file-010.parquet"));
  EXPECT_FALSE(beforeFileName("file-010.parquet", "file-2.parquet"));
  EXPECT_TRUE(beforeFileName("chunk-000/file-999.parquet", "chunk-001/file-000.parquet"));
  EXPECT_TRUE(beforeFileName("", "a"));
  EXPECT_FALSE(beforeFileName("a", ""));
  EXPECT_FALSE(beforeFileName("abc", "abc"));
  EXPECT_TRUE(beforeFileName("abc", "abcd"));
  // equivalent numbers
  EXPECT_FALSE(beforeFileName("file-1", "file-01"));
  EXPECT_FALSE(beforeFileName("file-01", "file-1"));

  vector<string> files = {
      "chunk-001/file-000.parquet",
      "chunk-000/file-10.parquet",
      "chunk-000/file-9.parquet",
      "chunk-000/file-000.parquet"};
  sort(files.begin(), files.end(), [](const string& left, const string& right) {
    return beforeFileName(left, right);
  });
  EXPECT_EQ(
      files,
      vector<string>(
          {"chunk-000/file-000.parquet",
           "chunk-000/file-9.parquet",
           "chunk-000/file-10.parquet",
           "chunk-001/file-000.parquet"}));
}

TEST_F(StringsHelpersTester, humanReadableDuration) {
  using namespace reshard::helpers;
  EXPECT_EQ(humanReadableDuration(0), "0.000s");
  EXPECT_EQ(humanReadableDuration(1.5), "1.500s");
  EXPECT_EQ(humanReadableDuration(0.25), "250ms");
  EXPECT_EQ(humanReadableDuration(0.001), "1000us");
  EXPECT_EQ(humanReadableDuration(90), "1m 30.0s");
  EXPECT_EQ(humanReadableDuration(3725), "1h 2m 5s");
  EXPECT_EQ(humanReadableDuration(-2), "-2.000s");
}
