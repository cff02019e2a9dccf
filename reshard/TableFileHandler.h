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

#include <cstdint>

#include <string>
#include <vector>

#include <reshard/Coordinates.h>

namespace reshard {

using std::string;
using std::vector;

/// \brief Interface to the columnar table files of a dataset (parquet files, in practice).
///
/// A table file holds either frame rows (tabular store) or episode rows (meta/episodes store).
/// Implementations are plugged in at runtime, see BackendFactory.
/// All methods must be safe to call concurrently, as long as different calls don't write the same
/// file. Methods return 0 on success, or an error code, preferably of the TableFileErrorDomain.
class TableFileHandler {
 public:
  TableFileHandler() = default;
  virtual ~TableFileHandler();

  TableFileHandler(const TableFileHandler&) = delete;
  TableFileHandler& operator=(const TableFileHandler&) = delete;

  /// Name used to register & find the handler.
  virtual const string& getName() const = 0;

  /// Read all the frame rows of a table file, in file order.
  virtual int readFrames(const string& path, vector<FrameRecord>& outFrames) const = 0;

  /// Read rowCount frame rows, starting at row firstRow.
  /// The default implementation reads the whole file, then trims the result.
  /// @return 0 on success, INVALID_RANGE if the file doesn't have enough rows.
  virtual int readFrameRange(
      const string& path,
      uint64_t firstRow,
      uint64_t rowCount,
      vector<FrameRecord>& outFrames) const;

  /// Write a whole table file of frame rows, replacing the file if it exists.
  virtual int writeFrames(const string& path, const vector<FrameRecord>& frames) const = 0;

  /// Read all the episode rows of a table file, in file order.
  virtual int readEpisodes(const string& path, vector<EpisodeRecord>& outEpisodes) const = 0;

  /// Write a whole table file of episode rows, replacing the file if it exists.
  virtual int writeEpisodes(const string& path, const vector<EpisodeRecord>& episodes) const = 0;
};

} // namespace reshard
