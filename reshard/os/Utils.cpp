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

#include <reshard/os/Utils.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include <algorithm>
#include <memory>

#include <boost/filesystem.hpp>

#define DEFAULT_LOG_CHANNEL "OsUtils"
#include <logging/Log.h>

namespace fs = boost::filesystem;
using fs_error_code = boost::system::error_code;

using namespace std;

namespace reshard::os {

namespace {

struct FileCloser {
  void operator()(FILE* file) const {
    fclose(file);
  }
};
using UniqueFile = unique_ptr<FILE, FileCloser>;

// make 'path/to/folder' and 'path/to/folder/' mean the same thing
fs::path getCleanedPath(const string& path) {
  string p{path};
  while (p.size() > 1 && (p.back() == '/' || p.back() == '\\')) {
    p.pop_back();
  }
  return fs::path(p);
}

int makeDir(const string& dir) {
  fs_error_code code;
  return fs::create_directory(fs::path(dir), code) ? 0 : code.value();
}

} // namespace

string pathJoin(const string& a, const string& b) {
  return (fs::path(a) / b).generic_string();
}

string pathJoin(const string& a, const string& b, const string& c) {
  return (fs::path(a) / b / c).generic_string();
}

int makeDirectories(const string& dir) {
  fs_error_code code;
  if (fs::create_directories(dir, code)) {
    return 0;
  }
  // create_directories returns false without error when the folder is already there
  return code ? code.value() : (isDir(dir) ? 0 : EEXIST);
}

bool isDir(const string& path) {
  fs_error_code ec;
  return fs::is_directory(fs::path(path), ec);
}

bool isFile(const string& path) {
  fs_error_code ec;
  auto type = fs::status(fs::path(path), ec).type(); // This will traverse symlinks
  if (ec) {
    return false;
  }
  return type == fs::file_type::regular_file;
}

bool pathExists(const string& path) {
  fs_error_code ec;
  auto type = fs::status(fs::path(path), ec).type();
  if (ec) {
    return false;
  }
  return type != fs::file_type::file_not_found;
}

int64_t getFileSize(const string& path) {
  fs_error_code ec;
  auto size = fs::file_size(fs::path(path), ec);
  if (ec) {
    return -1;
  }
  return static_cast<int64_t>(size);
}

string getFilename(const string& path) {
  return getCleanedPath(path).filename().generic_string();
}

string getParentFolder(const string& path) {
  return getCleanedPath(path).parent_path().generic_string();
}

vector<string> listDir(const string& dir) {
  vector<string> names;
  fs_error_code ec;
  for (fs::directory_iterator iter(dir, ec), end; !ec && iter != end; iter.increment(ec)) {
    names.emplace_back(iter->path().filename().generic_string());
  }
  sort(names.begin(), names.end());
  return names;
}

int listFilesRecursively(const string& dir, vector<string>& outRelativePaths, const string& ext) {
  outRelativePaths.clear();
  fs_error_code ec;
  const fs::path root = getCleanedPath(dir);
  fs::recursive_directory_iterator iter(root, ec);
  if (ec) {
    return ec.value();
  }
  for (fs::recursive_directory_iterator end; iter != end; iter.increment(ec)) {
    if (ec) {
      return ec.value();
    }
    if (!fs::is_regular_file(iter->status())) {
      continue;
    }
    if (!ext.empty() && iter->path().extension().generic_string() != ext) {
      continue;
    }
    outRelativePaths.emplace_back(iter->path().lexically_relative(root).generic_string());
  }
  sort(outRelativePaths.begin(), outRelativePaths.end());
  return 0;
}

int rename(const string& originalName, const string& newName) {
  fs_error_code ec;
  fs::rename(fs::path(originalName), fs::path(newName), ec);
  return ec.value();
}

int remove(const string& path) {
  fs_error_code ec;
  fs::remove(fs::path(path), ec);
  return ec.value();
}

int removeAll(const string& path) {
  fs_error_code ec;
  fs::remove_all(fs::path(path), ec);
  return ec.value();
}

int copyFile(const string& sourcePath, const string& destinationPath) {
  string parent = getParentFolder(destinationPath);
  if (!parent.empty()) {
    int status = makeDirectories(parent);
    if (status != 0) {
      return status;
    }
  }
  fs_error_code ec;
  fs::copy_file(
      fs::path(sourcePath),
      fs::path(destinationPath),
      fs::copy_options::overwrite_existing,
      ec);
  return ec.value();
}

int readTextFile(const string& path, string& outText) {
  outText.clear();
  UniqueFile file(fopen(path.c_str(), "rb"));
  if (!file) {
    return errno;
  }
  char buffer[16 * 1024];
  size_t readSize;
  while ((readSize = fread(buffer, 1, sizeof(buffer), file.get())) > 0) {
    outText.append(buffer, readSize);
  }
  return ferror(file.get()) != 0 ? EIO : 0;
}

int writeTextFile(const string& path, const string& text) {
  UniqueFile file(fopen(path.c_str(), "wb"));
  if (!file) {
    return errno;
  }
  if (fwrite(text.data(), 1, text.size(), file.get()) != text.size()) {
    return errno != 0 ? errno : EIO;
  }
  FILE* rawFile = file.release();
  return fclose(rawFile) == 0 ? 0 : errno;
}

string randomName(int length) {
  auto randchar = []() -> char {
    const char charset[] =
        "0123456789_"
        "abcdefghijklmnopqrstuvwxyz";
    const size_t max_index = (sizeof(charset) - 1);
    return charset[static_cast<size_t>(rand()) % max_index];
  };
  string str(length, 0);
  generate_n(str.begin(), length, randchar);
  return str;
}

const string& getTempFolder() {
  static string sUniqueFolderName = [] {
    fs::path tempDir = fs::temp_directory_path();
    string uniqueFolderName;
    do {
      uniqueFolderName = (tempDir / ("reshard-" + randomName(10))).string();
    } while (pathExists(uniqueFolderName) || makeDir(uniqueFolderName) != 0);
    uniqueFolderName += '/';
    RS_LOGD("Temp folder: {}", uniqueFolderName);
    return uniqueFolderName;
  }();
  return sUniqueFolderName;
}

string getUniquePath(const string& baseName, size_t randomSuffixLength) {
  string uniqueName;
  uniqueName.reserve(baseName.size() + 1 + randomSuffixLength);
  uniqueName = baseName + '~';
  do {
    uniqueName.resize(baseName.size() + 1);
    uniqueName += randomName(static_cast<int>(randomSuffixLength));
  } while (os::pathExists(uniqueName));
  return uniqueName;
}

} // namespace reshard::os
