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
#include <memory>
#include <mutex>
#include <string>

#include <reshard/TableFileHandler.h>
#include <reshard/VideoCodec.h>

namespace reshard {

using std::map;
using std::mutex;
using std::shared_ptr;
using std::string;

/// The collaborators a dataset uses to read & write its files.
struct Backends {
  shared_ptr<TableFileHandler> tables;
  shared_ptr<VideoCodec> video;
};

/// \brief A factory system for the table file handlers & video codecs, allowing the runtime
/// registration & usage of custom implementations.
/// The first implementation registered of each kind is the default one.
class BackendFactory {
 public:
  static BackendFactory& getInstance();

  void registerTableFileHandler(shared_ptr<TableFileHandler> tableFileHandler);
  void unregisterTableFileHandler(const string& name);
  /// @param name: name of the handler, or empty for the default handler.
  /// @return The handler, or nullptr.
  shared_ptr<TableFileHandler> getTableFileHandler(const string& name = {});

  void registerVideoCodec(shared_ptr<VideoCodec> videoCodec);
  void unregisterVideoCodec(const string& name);
  /// @param name: name of the codec, or empty for the default codec.
  /// @return The codec, or nullptr.
  shared_ptr<VideoCodec> getVideoCodec(const string& name = {});

  /// Get a table handler and a video codec.
  /// @return 0 on success, TABLE_HANDLER_UNAVAILABLE or VIDEO_CODEC_UNAVAILABLE.
  int getBackends(const string& tableHandlerName, const string& videoCodecName, Backends& out);

 protected:
  BackendFactory() = default;
  virtual ~BackendFactory() = default;

 private:
  mutex mutex_;
  map<string, shared_ptr<TableFileHandler>> tableFileHandlerMap_;
  map<string, shared_ptr<VideoCodec>> videoCodecMap_;
  string defaultTableFileHandler_;
  string defaultVideoCodec_;
};

} // namespace reshard
