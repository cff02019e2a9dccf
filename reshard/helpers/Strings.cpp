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

#include "Strings.h"

#include <cctype>
#include <cmath>

#include <algorithm>

#include <fmt/format.h>

namespace reshard {
namespace helpers {

using namespace std;

bool startsWith(const string_view& text, const string_view& prefix) {
  return text.length() >= prefix.length() && text.compare(0, prefix.length(), prefix) == 0;
}

inline bool isdigit(char c) {
  return std::isdigit(static_cast<uint8_t>(c));
}

static uint32_t lastDigitIndex(const char* str, uint32_t index) {
  while (isdigit(str[index + 1])) {
    index++;
  }
  return index;
}

inline char paddedChar(const char* str, uint32_t pos, uint32_t pad, uint32_t index) {
  return index < pad ? '0' : str[pos + index - pad];
}

bool beforeFileName(const char* left, const char* right) {
  uint32_t leftPos = 0;
  uint32_t rightPos = 0;
  bool bothDigits = false;
  while ((bothDigits = (isdigit(left[leftPos]) && isdigit(right[rightPos]))) ||
         (left[leftPos] == right[rightPos] && left[leftPos] != 0)) {
    if (bothDigits) {
      uint32_t leftDigitLength = lastDigitIndex(left, leftPos) - leftPos;
      uint32_t rightDigitLength = lastDigitIndex(right, rightPos) - rightPos;
      uint32_t leftPad =
          leftDigitLength < rightDigitLength ? rightDigitLength - leftDigitLength : 0;
      uint32_t rightPad =
          rightDigitLength < leftDigitLength ? leftDigitLength - rightDigitLength : 0;
      uint32_t lastIndex = max<uint32_t>(leftDigitLength, rightDigitLength);
      for (uint32_t digitIndex = 0; digitIndex <= lastIndex; digitIndex++) {
        char lc = paddedChar(left, leftPos, leftPad, digitIndex);
        char rc = paddedChar(right, rightPos, rightPad, digitIndex);
        if (lc != rc) {
          return lc < rc;
        }
      }
      leftPos += leftDigitLength;
      rightPos += rightDigitLength;
    }
    leftPos++, rightPos++;
  }
  if (left[leftPos] == 0) {
    return right[rightPos] != 0;
  }
  return left[leftPos] < right[rightPos];
}

string humanReadableDuration(double seconds) {
  const char* sign = "";
  if (seconds < 0) {
    sign = "-";
    seconds = -seconds;
  }
  const double kMinute = 60;
  const double kHour = 60 * kMinute;
  if (seconds >= kHour) {
    int hours = static_cast<int>(seconds / kHour);
    int minutes = static_cast<int>((seconds - hours * kHour) / kMinute);
    return fmt::format("{}{}h {}m {:.0f}s", sign, hours, minutes, fmod(seconds, kMinute));
  }
  if (seconds >= kMinute) {
    int minutes = static_cast<int>(seconds / kMinute);
    return fmt::format("{}{}m {:.1f}s", sign, minutes, seconds - minutes * kMinute);
  }
  if (seconds == 0 || seconds >= 1) {
    return fmt::format("{}{:.3f}s", sign, seconds);
  }
  if (seconds >= 2e-3) {
    return fmt::format("{}{:.0f}ms", sign, seconds * 1e03);
  }
  return fmt::format("{}{:.0f}us", sign, seconds * 1e06);
}

} // namespace helpers
} // namespace reshard
