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

#include <reshard/VideoCodec.h>

namespace reshard::test {

using std::string;
using std::vector;

enum class RawFrameCodecError {
  CorruptFile = 1,
  NoFrames,
  InconsistentFrames,
  SeekOutOfRange,
};

/// Lossless test codec: frames are stored uncompressed, after a small header, so that tests can
/// verify that decoded pixels are exactly the ones that were encoded.
/// Decoding a seek time returns the frame closest to that time, like a real decoder would.
class RawFrameCodec : public VideoCodec {
 public:
  static const string& staticName();

  const string& getName() const override {
    return staticName();
  }
  int decodeFrames(
      const string& path,
      const vector<SeekTime>& seekTimes,
      vector<VideoFrame>& outFrames) const override;
  int encodeFrames(
      const string& path,
      const vector<VideoFrame>& frames,
      const VideoEncodeSettings& settings) const override;

  /// Number of frames of a file, or -1 on error.
  static int64_t getFrameCount(const string& path);
};

/// Synthetic frame, whose pixels encode a video key, an episode & a frame index.
VideoFrame makeTestFrame(uint32_t keySeed, uint32_t episodeIndex, uint32_t frameIndex);

} // namespace reshard::test
