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
#include <string_view>

namespace reshard {
namespace helpers {

/// Compare strings, as you'd expect in a modern desktop OS (Explorer/Finder), treating digit
/// sections as numbers, so that "file-2.parquet" is before "file-010.parquet".
/// Note: This is not a total order, since beforeFileName("file-1", "file-01") and
/// beforeFileName("file-01", "file-1") are both false!
bool beforeFileName(const char* left, const char* right);

inline bool beforeFileName(const std::string& left, const std::string& right) {
  return beforeFileName(left.c_str(), right.c_str());
}

/// Tell if a text string starts with the provided prefix. Case sensitive.
bool startsWith(const std::string_view& text, const std::string_view& prefix);

/// Print a duration in seconds, using the best unit, with up to 3 decimals.
std::string humanReadableDuration(double seconds);

} // namespace helpers
} // namespace reshard
