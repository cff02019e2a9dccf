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

enum class Level {
  Error = 0,
  Warning = 1,
  Info = 2,
  Debug = 3,
};

/// Logging backend: messages are printed to stderr, colored by level.
/// Messages less important than the current max level are dropped.
void log(Level level, const char* channel, const std::string& message);

/// Set the least important level that is still printed. Default: Info.
void setMaxLevel(Level level);
Level getMaxLevel();

} // namespace logging
} // namespace reshard

#ifdef DEFAULT_LOG_CHANNEL
#define RS_LOG_DEFAULT(level, ...) \
  reshard::logging::log(level, DEFAULT_LOG_CHANNEL, fmt::format(__VA_ARGS__))

#define RS_LOGD(...) RS_LOG_DEFAULT(reshard::logging::Level::Debug, __VA_ARGS__)
#define RS_LOGI(...) RS_LOG_DEFAULT(reshard::logging::Level::Info, __VA_ARGS__)
#define RS_LOGW(...) RS_LOG_DEFAULT(reshard::logging::Level::Warning, __VA_ARGS__)
#define RS_LOGE(...) RS_LOG_DEFAULT(reshard::logging::Level::Error, __VA_ARGS__)
#endif

#define RS_LOG_CHANNEL(level, channel, ...) \
  reshard::logging::log(level, channel, fmt::format(__VA_ARGS__))

#define RS_LOGCD(CHANNEL, ...) RS_LOG_CHANNEL(reshard::logging::Level::Debug, CHANNEL, __VA_ARGS__)
#define RS_LOGCI(CHANNEL, ...) RS_LOG_CHANNEL(reshard::logging::Level::Info, CHANNEL, __VA_ARGS__)
#define RS_LOGCW(CHANNEL, ...) \
  RS_LOG_CHANNEL(reshard::logging::Level::Warning, CHANNEL, __VA_ARGS__)
#define RS_LOGCE(CHANNEL, ...) RS_LOG_CHANNEL(reshard::logging::Level::Error, CHANNEL, __VA_ARGS__)
