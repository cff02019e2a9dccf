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

#include <fmt/core.h>

namespace reshard {
namespace logging {

[[noreturn]] void logAndAbort(const char* condition, const std::string& message = {});

} // namespace logging
} // namespace reshard

//
// Check Macros: contract violations, not runtime errors.
//

#define RS_CHECK_FORMAT(condition, fmtstr, ...) \
  ((condition)                                  \
       ? 0                                      \
       : ((reshard::logging::logAndAbort(#condition, fmt::format(fmtstr, ##__VA_ARGS__))), 0))

#define RS_CHECK(condition, ...) RS_CHECK_FORMAT(condition, "" __VA_ARGS__)

#define RS_CHECK_EQ(val1, val2, ...) RS_CHECK((val1) == (val2), ##__VA_ARGS__)
#define RS_CHECK_NE(val1, val2, ...) RS_CHECK((val1) != (val2), ##__VA_ARGS__)
#define RS_CHECK_GE(val1, val2, ...) RS_CHECK((val1) >= (val2), ##__VA_ARGS__)
#define RS_CHECK_GT(val1, val2, ...) RS_CHECK((val1) > (val2), ##__VA_ARGS__)
#define RS_CHECK_LE(val1, val2, ...) RS_CHECK((val1) <= (val2), ##__VA_ARGS__)
#define RS_CHECK_LT(val1, val2, ...) RS_CHECK((val1) < (val2), ##__VA_ARGS__)
#define RS_CHECK_NOTNULL(val, ...) RS_CHECK((val) != nullptr, ##__VA_ARGS__)

// RS_PRECONDITION_NOTNULL performs a not-null check but returns the value,
// so this macro can be used in initializer lists
#define RS_PRECONDITION_NOTNULL(_val, ...) ((RS_CHECK_NOTNULL(_val, ##__VA_ARGS__)), _val)
