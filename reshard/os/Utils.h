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
#include <string>
#include <vector>

/// Mini-OS abstraction layer, over Boost.Filesystem.
/// Functions returning int return 0 on success, or a system error code.

namespace reshard {
namespace os {

/// Path joining helpers
std::string pathJoin(const std::string& a, const std::string& b);
std::string pathJoin(const std::string& a, const std::string& b, const std::string& c);
template <class... Args>
std::string
pathJoin(const std::string& a, const std::string& b, const std::string& c, Args... args) {
  return reshard::os::pathJoin(reshard::os::pathJoin(a, b, c), args...);
}

/// Create a folder, and its missing parents
int makeDirectories(const std::string& dir);

/// File path helpers
bool isDir(const std::string& path);
bool isFile(const std::string& path);
bool pathExists(const std::string& path);
int64_t getFileSize(const std::string& path);
std::string getFilename(const std::string& path);
std::string getParentFolder(const std::string& path);

/// Names of the entries of a folder (not full paths), sorted.
std::vector<std::string> listDir(const std::string& dir);

/// Paths of all the regular files under a folder, relative to that folder, using '/' separators,
/// sorted. When extension isn't empty (ex: ".parquet"), only files with that extension are listed.
int listFilesRecursively(
    const std::string& dir,
    std::vector<std::string>& outRelativePaths,
    const std::string& extension = {});

/// Misc helpers
int rename(const std::string& originalName, const std::string& newName); // file or folder
int remove(const std::string& path); // file or empty folder
int removeAll(const std::string& path); // recursive
/// Copy a file, creating the destination's parent folders when needed.
int copyFile(const std::string& sourcePath, const std::string& destinationPath);

/// Whole-file helpers
int readTextFile(const std::string& path, std::string& outText);
int writeTextFile(const std::string& path, const std::string& text);

std::string randomName(int length);
const std::string& getTempFolder();
std::string getUniquePath(const std::string& baseName, size_t randomSuffixLength = 5);

} // namespace os
} // namespace reshard
