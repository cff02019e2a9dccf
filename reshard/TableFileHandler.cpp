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

#include <reshard/TableFileHandler.h>

#define DEFAULT_LOG_CHANNEL "TableFileHandler"
#include <logging/Log.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>

using namespace std;

namespace reshard {

TableFileHandler::~TableFileHandler() = default;

int TableFileHandler::readFrameRange(
    const string& path,
    uint64_t firstRow,
    uint64_t rowCount,
    vector<FrameRecord>& outFrames) const {
  outFrames.clear();
  vector<FrameRecord> frames;
  IF_ERROR_LOG_AND_RETURN(readFrames(path, frames));
  if (firstRow + rowCount > frames.size()) {
    RS_LOGE(
        "Can't read rows {}-{} of '{}', which has {} rows.",
        firstRow,
        firstRow + rowCount,
        path,
        frames.size());
    return INVALID_RANGE;
  }
  auto first = frames.begin() + static_cast<ptrdiff_t>(firstRow);
  outFrames.assign(
      make_move_iterator(first), make_move_iterator(first + static_cast<ptrdiff_t>(rowCount)));
  return SUCCESS;
}

} // namespace reshard
