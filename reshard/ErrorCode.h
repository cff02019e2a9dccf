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

#include <map>
#include <string>

#include <fmt/format.h>

namespace reshard {

#if defined(__APPLE__)
// Largest error number is 100102 kPOSIXErrorEOPNOTSUPP
const int kPlatformUserErrorsStart = 200000;
#elif defined(_WIN32)
const int kPlatformUserErrorsStart = 1 << 29; // bit 29 is set for user errors
#else
const int kPlatformUserErrorsStart = 1000; // Errorno is 131
#endif

const int kSimpleErrorsSize = 1000;
const int kErrorsDomainSize = 100;
const int kDomainErrorsStart = kPlatformUserErrorsStart + kSimpleErrorsSize;

/// Enum for regular reshard errors.
/// All the APIs return an int status: 0 on success, an ErrorCode, a system error (errno values),
/// or a domain error code (see below).
enum ErrorCode : int {
  SUCCESS = 0,

  FAILURE = kPlatformUserErrorsStart,
  NOT_SUPPORTED,
  NOT_IMPLEMENTED,
  INTERNAL_ERROR,

  FILE_NOT_FOUND,
  INVALID_PARAMETER,
  INVALID_REQUEST,
  INVALID_RANGE,
  INVALID_DISK_DATA,
  READ_ERROR,
  WRITE_ERROR,
  OPERATION_CANCELLED,
  INVALID_DATASET_INFO,
  INVALID_PATH_TEMPLATE,
  TABLE_HANDLER_UNAVAILABLE,
  VIDEO_CODEC_UNAVAILABLE,

  // Coordinate errors: a read request can't be mapped to a video position
  EPISODE_NOT_FOUND,
  MISSING_VIDEO_STREAM,
  INVALID_TIME_OFFSET,
  FRAME_NOT_FOUND,

  // Shard consistency errors: the stores don't describe a valid partition of the frames
  SHARD_NOT_FOUND,
  SHARD_CONSISTENCY_ERROR,
  NON_CONTIGUOUS_GLOBAL_INDEX,

  // Media codec errors
  MEDIA_DECODE_ERROR,
  MEDIA_ENCODE_ERROR,
};

/// Errors can come from reshard, or from a collaborator like a video codec or a table file handler.
/// There is no telling if these error codes will collide with the OS', reshard's or each other.
/// Error domains create a safe mechanism to report any of these errors as an int,
/// which can then be converted back to a human readable string using errorCodeToMessage(code).
/// The caveat is that the numeric values themselves may vary from run-to-run.
/// Error domains can be created dynamically, with the limitation that 99 distinct custom errors per
/// domain can be tracked during a single run.
enum class ErrorDomain : int {
  VideoCodecErrorDomain,
  TableFileErrorDomain,

  // keep last, as we will add to this enum at runtime using newErrorDomain()
  CustomDomains
};

/// Conversion of a error domain to an int. For internal & test purposes only.
constexpr int errorDomainToErrorCodeStart(ErrorDomain errorDomain) {
  return kDomainErrorsStart + static_cast<int>(errorDomain) * kErrorsDomainSize;
}

/// Tell if an error code belongs to an error domain.
bool isDomainError(int errorCode, ErrorDomain errorDomain);

/// Convert an int error code into a human readable string for logging.
/// This API should work with any int error code returned by any reshard API.
/// @param errorCode: an error code returned by any reshard API.
/// @return A string that describes the error.
std::string errorCodeToMessage(int errorCode);

/// Same as errorCodeToMessage(), but includes the error code's numeric value.
std::string errorCodeToMessageWithCode(int errorCode);

/// Error classification helpers.
/// Coordinate errors: EPISODE_NOT_FOUND, MISSING_VIDEO_STREAM, INVALID_TIME_OFFSET,
/// FRAME_NOT_FOUND. They are reported immediately, there is no point retrying.
bool isCoordinateError(int errorCode);
/// Shard consistency errors: SHARD_NOT_FOUND, SHARD_CONSISTENCY_ERROR,
/// NON_CONTIGUOUS_GLOBAL_INDEX. They are fatal to any batch operation.
bool isShardConsistencyError(int errorCode);
/// Media codec errors: MEDIA_DECODE_ERROR, MEDIA_ENCODE_ERROR, and any error of the
/// VideoCodecErrorDomain.
bool isMediaCodecError(int errorCode);

/// Create a new error domain, based on a name that's supposed to be unique, such as "FFmpeg"
/// @param domainName: some unique domain name.
/// @return A new error domain enum value.
ErrorDomain newErrorDomain(const std::string& domainName);

/// Create an int error code for a specific error domain and error code within that domain.
/// @param errorDomain: the error domain of the error code.
/// @param errorCode: an error code within that domain, which can be any value.
/// @param errorMessage: an error description for the errorCode.
/// @return An int that can be safely returned to represent the domain error.
/// The errorMessage is saved, so that future calls to errorCodeToMessage() will return that
/// error message for that int error code.
int domainErrorCode(ErrorDomain errorDomain, int64_t errorCode, const char* errorMessage);

/// Helper function so that any integer error type (including enums) can be used for domain errors,
/// as this template helper will simply cast that error code to an int64.
template <class T>
int domainErrorCode(ErrorDomain errorDomain, T errorCode, const char* errorMessage) {
  return domainErrorCode(errorDomain, static_cast<int64_t>(errorCode), errorMessage);
}

/// Helper class to define your own error domain.
/// - create an enum class for your errors, that you pass to your template.
/// - provide a map enum -> to text, to explain each enum.
/// You can then call domainError() to get an int error code that you can return.

template <class EC>
const std::map<EC, const char*>& getErrorCodeRegistry();

template <class EC>
ErrorDomain getErrorDomain();

template <class EC>
int domainError(EC errorCode) {
  const std::map<EC, const char*>& registry = getErrorCodeRegistry<EC>();
  auto iter = registry.find(errorCode);
  if (iter != registry.end()) {
    return domainErrorCode(getErrorDomain<EC>(), errorCode, iter->second);
  }
  std::string msg = fmt::format("<Unknown error code '{}'>", static_cast<int>(errorCode));
  return domainErrorCode(getErrorDomain<EC>(), errorCode, msg.c_str());
}

} // namespace reshard
