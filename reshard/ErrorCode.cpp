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

#include <reshard/ErrorCode.h>

#include <cstring>

#include <map>
#include <mutex>
#include <string>

using namespace std;
using namespace reshard;

namespace {
const char* getSimpleErrorName(int errorCode) {
  static map<int, const char*> sRegistry = {
      {SUCCESS, "Success"},
      {FAILURE, "Misc error"},

      {NOT_SUPPORTED, "Given method is not supported"},
      {NOT_IMPLEMENTED, "Given method is not implemented"},
      {INTERNAL_ERROR, "Internal error"},

      {FILE_NOT_FOUND, "File not found"},
      {INVALID_PARAMETER, "Invalid parameter"},
      {INVALID_REQUEST, "Invalid request"},
      {INVALID_RANGE, "Invalid range"},
      {INVALID_DISK_DATA, "Read error: invalid data"},
      {READ_ERROR, "Read error"},
      {WRITE_ERROR, "Write error"},
      {OPERATION_CANCELLED, "Operation cancelled"},
      {INVALID_DATASET_INFO, "Invalid or incomplete dataset info"},
      {INVALID_PATH_TEMPLATE, "Invalid path template"},
      {TABLE_HANDLER_UNAVAILABLE, "No table file handler available"},
      {VIDEO_CODEC_UNAVAILABLE, "No video codec available"},

      {EPISODE_NOT_FOUND, "Episode not found"},
      {MISSING_VIDEO_STREAM, "Missing video stream"},
      {INVALID_TIME_OFFSET, "Invalid time offset"},
      {FRAME_NOT_FOUND, "Frame not found"},

      {SHARD_NOT_FOUND, "Shard not found"},
      {SHARD_CONSISTENCY_ERROR, "Shard consistency error"},
      {NON_CONTIGUOUS_GLOBAL_INDEX, "Non contiguous global index"},

      {MEDIA_DECODE_ERROR, "Media decode error"},
      {MEDIA_ENCODE_ERROR, "Media encode error"},
  };
  auto iter = sRegistry.find(errorCode);
  return iter != sRegistry.end() ? iter->second : nullptr;
}

int newDomainErrorCode(ErrorDomain errorDomain, int64_t errorCode) {
  static mutex sRangeIndexMapMutex;
  static map<int, map<int64_t, int>> sRangeIndexMap;
  unique_lock<mutex> lock(sRangeIndexMapMutex);
  map<int64_t, int>& indexMap = sRangeIndexMap[errorDomainToErrorCodeStart(errorDomain)];
  int& newErrorCode = indexMap[errorCode]; // create a code of value 0 if it didn't exist
  if (newErrorCode != 0) {
    return newErrorCode; // the error existed already
  }
  if (indexMap.size() >= kErrorsDomainSize - 1) {
    // Too many errors for that domain
    return FAILURE;
  }
  newErrorCode = errorDomainToErrorCodeStart(errorDomain) + static_cast<int>(indexMap.size());
  return newErrorCode;
}

map<int, string> sDomainErrorRegistry;
mutex sDomainErrorRegistryMutex;

} // namespace

namespace reshard {

string errorCodeToMessage(int errorCode) {
  if (errorCode < 0 || (errorCode > 0 && errorCode < kPlatformUserErrorsStart)) {
    return strerror(errorCode);
  }
  const char* errorName = getSimpleErrorName(errorCode);
  if (errorName != nullptr) {
    return errorName;
  }
  {
    unique_lock<mutex> lock(sDomainErrorRegistryMutex);
    auto iter = sDomainErrorRegistry.find(errorCode);
    if (iter != sDomainErrorRegistry.end()) {
      return iter->second;
    }
  }
  return fmt::format("<Unknown error code '{}'>", errorCode);
}

string errorCodeToMessageWithCode(int errorCode) {
  return errorCodeToMessage(errorCode) + " (#" + to_string(errorCode) + ")";
}

bool isDomainError(int errorCode, ErrorDomain errorDomain) {
  int start = errorDomainToErrorCodeStart(errorDomain);
  return errorCode > start && errorCode < start + kErrorsDomainSize;
}

bool isCoordinateError(int errorCode) {
  return errorCode == EPISODE_NOT_FOUND || errorCode == MISSING_VIDEO_STREAM ||
      errorCode == INVALID_TIME_OFFSET || errorCode == FRAME_NOT_FOUND;
}

bool isShardConsistencyError(int errorCode) {
  return errorCode == SHARD_NOT_FOUND || errorCode == SHARD_CONSISTENCY_ERROR ||
      errorCode == NON_CONTIGUOUS_GLOBAL_INDEX;
}

bool isMediaCodecError(int errorCode) {
  return errorCode == MEDIA_DECODE_ERROR || errorCode == MEDIA_ENCODE_ERROR ||
      isDomainError(errorCode, ErrorDomain::VideoCodecErrorDomain);
}

ErrorDomain newErrorDomain(const string& domainName) {
  static mutex sCustomDomainMapMutex;
  static map<string, ErrorDomain> sCustomDomainMap;
  unique_lock<mutex> lock(sCustomDomainMapMutex);
  ErrorDomain& errorDomain = sCustomDomainMap[domainName];
  if (static_cast<int>(errorDomain) == 0) {
    errorDomain = static_cast<ErrorDomain>(
        static_cast<int>(ErrorDomain::CustomDomains) +
        static_cast<int>(sCustomDomainMap.size() - 1));
    unique_lock<mutex> domain_lock(sDomainErrorRegistryMutex);
    sDomainErrorRegistry[errorDomainToErrorCodeStart(errorDomain)] = domainName;
  }
  return errorDomain;
}

int domainErrorCode(ErrorDomain errorDomain, int64_t errorCode, const char* errorMessage) {
  unique_lock<mutex> lock(sDomainErrorRegistryMutex);
  static bool sInternalDomainsRegistered = false;
  if (!sInternalDomainsRegistered) {
    sInternalDomainsRegistered = true;
    sDomainErrorRegistry[errorDomainToErrorCodeStart(ErrorDomain::VideoCodecErrorDomain)] =
        "Video codec";
    sDomainErrorRegistry[errorDomainToErrorCodeStart(ErrorDomain::TableFileErrorDomain)] =
        "Table file";
  }
  int newErrorCode = newDomainErrorCode(errorDomain, errorCode);
  // check if there are already too many errors registered for that domain.
  if (newErrorCode == FAILURE) {
    newErrorCode = errorDomainToErrorCodeStart(errorDomain) + kErrorsDomainSize - 1;
    string& lastErrorMessage = sDomainErrorRegistry[newErrorCode];
    if (lastErrorMessage.empty()) {
      lastErrorMessage = sDomainErrorRegistry[errorDomainToErrorCodeStart(errorDomain)] +
          " error: <too many domain errors to track>";
    }
    return newErrorCode;
  }
  // example: "Video codec error 3: truncated frame".
  // Always update the text, in case it changes, to return the last one!
  sDomainErrorRegistry[newErrorCode] =
      sDomainErrorRegistry[errorDomainToErrorCodeStart(errorDomain)] + " error " +
      to_string(errorCode) + ": " + errorMessage;

  return newErrorCode;
}

} // namespace reshard
