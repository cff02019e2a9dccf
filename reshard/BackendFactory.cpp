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

#include <reshard/BackendFactory.h>

#define DEFAULT_LOG_CHANNEL "BackendFactory"
#include <logging/Checks.h>
#include <logging/Log.h>

#include <reshard/ErrorCode.h>

using namespace std;

namespace reshard {

namespace {

template <class T>
void unregister(map<string, shared_ptr<T>>& registry, string& defaultName, const string& name) {
  registry.erase(name);
  if (defaultName == name) {
    defaultName = registry.empty() ? string() : registry.begin()->first;
  }
}

template <class T>
shared_ptr<T> find(map<string, shared_ptr<T>>& registry, const string& name) {
  auto iter = registry.find(name);
  return iter != registry.end() ? iter->second : nullptr;
}

} // namespace

BackendFactory& BackendFactory::getInstance() {
  static BackendFactory instance;
  return instance;
}

void BackendFactory::registerTableFileHandler(shared_ptr<TableFileHandler> tableFileHandler) {
  RS_CHECK_NOTNULL(tableFileHandler);
  unique_lock<mutex> lock(mutex_);
  string name = tableFileHandler->getName();
  if (tableFileHandlerMap_.empty()) {
    defaultTableFileHandler_ = name;
  }
  tableFileHandlerMap_[name] = std::move(tableFileHandler);
}

void BackendFactory::unregisterTableFileHandler(const string& name) {
  unique_lock<mutex> lock(mutex_);
  unregister(tableFileHandlerMap_, defaultTableFileHandler_, name);
}

shared_ptr<TableFileHandler> BackendFactory::getTableFileHandler(const string& name) {
  unique_lock<mutex> lock(mutex_);
  return find(tableFileHandlerMap_, name.empty() ? defaultTableFileHandler_ : name);
}

void BackendFactory::registerVideoCodec(shared_ptr<VideoCodec> videoCodec) {
  RS_CHECK_NOTNULL(videoCodec);
  unique_lock<mutex> lock(mutex_);
  string name = videoCodec->getName();
  if (videoCodecMap_.empty()) {
    defaultVideoCodec_ = name;
  }
  videoCodecMap_[name] = std::move(videoCodec);
}

void BackendFactory::unregisterVideoCodec(const string& name) {
  unique_lock<mutex> lock(mutex_);
  unregister(videoCodecMap_, defaultVideoCodec_, name);
}

shared_ptr<VideoCodec> BackendFactory::getVideoCodec(const string& name) {
  unique_lock<mutex> lock(mutex_);
  return find(videoCodecMap_, name.empty() ? defaultVideoCodec_ : name);
}

int BackendFactory::getBackends(
    const string& tableHandlerName,
    const string& videoCodecName,
    Backends& out) {
  out.tables = getTableFileHandler(tableHandlerName);
  if (!out.tables) {
    RS_LOGE("No table file handler '{}' available.", tableHandlerName);
    return TABLE_HANDLER_UNAVAILABLE;
  }
  out.video = getVideoCodec(videoCodecName);
  if (!out.video) {
    RS_LOGE("No video codec '{}' available.", videoCodecName);
    return VIDEO_CODEC_UNAVAILABLE;
  }
  return SUCCESS;
}

} // namespace reshard
