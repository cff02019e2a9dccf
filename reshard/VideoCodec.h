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

/// A decoded video frame, with interleaved 8 bit channels (RGB by default).
struct VideoFrame {
  uint32_t width{0};
  uint32_t height{0};
  uint32_t channels{3};
  vector<uint8_t> pixels;

  size_t expectedSize() const {
    return static_cast<size_t>(width) * height * channels;
  }
  bool isValid() const {
    return width > 0 && height > 0 && channels > 0 && pixels.size() == expectedSize();
  }
  bool operator==(const VideoFrame& rhs) const {
    return width == rhs.width && height == rhs.height && channels == rhs.channels &&
        pixels == rhs.pixels;
  }
};

/// How to encode a video shard file.
struct VideoEncodeSettings {
  double fps{30};
  string codec{"libsvtav1"};
  string pixelFormat{"yuv420p"};
  /// Constant rate factor, or the codec's equivalent quality setting.
  int crf{30};
  /// Max distance between key frames.
  int gop{2};
};

/// \brief Interface to the video decode/encode service.
///
/// Implementations are plugged in at runtime, see BackendFactory. Decoding must be safe to call
/// concurrently, and so must encoding of different files. Methods return 0 on success, or an error
/// code, preferably of the VideoCodecErrorDomain.
class VideoCodec {
 public:
  VideoCodec() = default;
  virtual ~VideoCodec();

  VideoCodec(const VideoCodec&) = delete;
  VideoCodec& operator=(const VideoCodec&) = delete;

  /// Name used to register & find the codec.
  virtual const string& getName() const = 0;

  /// Decode the frames displayed at some seek times of a video file.
  /// @param path: path of the video shard file.
  /// @param seekTimes: positions in the file, in any order.
  /// @param outFrames: on success, one frame per seek time, in the order of the seek times.
  virtual int decodeFrames(
      const string& path,
      const vector<SeekTime>& seekTimes,
      vector<VideoFrame>& outFrames) const = 0;

  /// Encode frames into a new video shard file, replacing the file if it exists.
  /// The first frame is at seek time 0, and frame i at seek time i / settings.fps.
  virtual int encodeFrames(
      const string& path,
      const vector<VideoFrame>& frames,
      const VideoEncodeSettings& settings) const = 0;
};

} // namespace reshard
