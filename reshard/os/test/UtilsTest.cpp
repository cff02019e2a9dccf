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

#include <reshard/os/Utils.h>

using namespace std;
using namespace reshard;

namespace {

struct OsUtilsTest : testing::Test {
  void SetUp() override {
    root = os::getUniquePath(os::getTempFolder() + "os_utils");
    ASSERT_EQ(os::makeDirectories(root), 0);
  }
  void TearDown() override {
    os::removeAll(root);
  }

  string root;
};

} // namespace

TEST_F(OsUtilsTest, paths) {
  EXPECT_EQ(os::pathJoin("root", "meta"), "root/meta");
  EXPECT_EQ(os::pathJoin("root", "meta", "info.json"), "root/meta/info.json");
  EXPECT_EQ(
      os::pathJoin("root", "videos", "chunk-000", "file-000.mp4"),
      "root/videos/chunk-000/file-000.mp4");
  EXPECT_EQ(os::getFilename("root/meta/info.json"), "info.json");
  EXPECT_EQ(os::getParentFolder("root/meta/info.json"), "root/meta");
  EXPECT_EQ(os::getFilename("root/meta/"), "meta");
}

TEST_F(OsUtilsTest, files) {
  string path = os::pathJoin(root, "meta", "info.json");
  EXPECT_FALSE(os::pathExists(path));
  EXPECT_NE(os::writeTextFile(path, "{}"), 0); // no parent folder
  ASSERT_EQ(os::makeDirectories(os::getParentFolder(path)), 0);
  ASSERT_EQ(os::makeDirectories(os::getParentFolder(path)), 0);
  ASSERT_EQ(os::writeTextFile(path, "{\"fps\": 10}"), 0);
  EXPECT_TRUE(os::isFile(path));
  EXPECT_FALSE(os::isDir(path));
  EXPECT_EQ(os::getFileSize(path), 11);
  EXPECT_EQ(os::getFileSize(path + ".nope"), -1);
  string text;
  ASSERT_EQ(os::readTextFile(path, text), 0);
  EXPECT_EQ(text, "{\"fps\": 10}");

  string copy = os::pathJoin(root, "copy", "meta", "info.json");
  ASSERT_EQ(os::copyFile(path, copy), 0);
  ASSERT_EQ(os::readTextFile(copy, text), 0);
  EXPECT_EQ(text, "{\"fps\": 10}");

  string moved = os::pathJoin(root, "moved");
  ASSERT_EQ(os::rename(os::pathJoin(root, "copy"), moved), 0);
  EXPECT_TRUE(os::isFile(os::pathJoin(moved, "meta", "info.json")));
  EXPECT_NE(os::remove(moved), 0); // not empty
  ASSERT_EQ(os::removeAll(moved), 0);
  EXPECT_FALSE(os::pathExists(moved));
}

TEST_F(OsUtilsTest, listFiles) {
  const vector<string> files = {
      "data/chunk-000/file-000.parquet",
      "data/chunk-000/file-001.parquet",
      "data/chunk-001/file-000.parquet",
      "data/chunk-001/notes.txt"};
  for (const string& file : files) {
    string path = os::pathJoin(root, file);
    ASSERT_EQ(os::makeDirectories(os::getParentFolder(path)), 0);
    ASSERT_EQ(os::writeTextFile(path, file), 0);
  }
  vector<string> found;
  ASSERT_EQ(os::listFilesRecursively(os::pathJoin(root, "data"), found, ".parquet"), 0);
  EXPECT_EQ(
      found,
      vector<string>(
          {"chunk-000/file-000.parquet",
           "chunk-000/file-001.parquet",
           "chunk-001/file-000.parquet"}));
  ASSERT_EQ(os::listFilesRecursively(os::pathJoin(root, "data"), found), 0);
  EXPECT_EQ(found.size(), 4);
  EXPECT_NE(os::listFilesRecursively(os::pathJoin(root, "nope"), found), 0);
  EXPECT_TRUE(found.empty());

  EXPECT_EQ(os::listDir(os::pathJoin(root, "data")), vector<string>({"chunk-000", "chunk-001"}));
}
