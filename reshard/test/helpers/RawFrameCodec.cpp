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

#include "RawFrameCodec.h"

#include <cmath>
#include <cstring>

#include <map>
#include <mutex>

#define DEFAULT_LOG_CHANNEL "RawFrameCodec"
#include <logging/Log.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/os/Utils.h>

using namespace std;

namespace reshard {

template <>
ErrorDomain getErrorDomain<test::RawFrameCodecError>() {
  return ErrorDomain::VideoCodecErrorDomain;
}

template <>
const map<test::RawFrameCodecError, const char*>&
getErrorCodeRegistry<test::RawFrameCodecError>() {
  static map<test::RawFrameCodecError, const char*> sRegistry;
  static once_flag sSingleInitFlag;
  call_once(sSingleInitFlag, [] {
    sRegistry = {
        {test::RawFrameCodecError::CorruptFile, "Corrupt raw frame file."},
        {test::RawFrameCodecError::NoFrames, "No frames to encode."},
        {test::RawFrameCodecError::InconsistentFrames, "Frames have different sizes."},
        {test::RawFrameCodecError::SeekOutOfRange, "Seek time outside of the video."},
    };
  });
  return sRegistry;
}

} // namespace reshard

namespace {

using namespace reshard;
using namespace reshard::test;

const char kMagic[8] = {'R', 'S', 'R', 'A', 'W', 'V', 'I', 'D'};

#pragma pack(push, 1)
struct RawFileHeader {
  char magic[8];
  uint32_t width;
  uint32_t height;
  uint32_t channels;
  uint32_t frameCount;
  double fps;
};
#pragma pack(pop)

int readFile(const string& path, RawFileHeader& outHeader, string& outContent) {
  IF_ERROR_LOG_AND_RETURN(os::readTextFile(path, outContent));
  if (outContent.size() < sizeof(RawFileHeader)) {
    return domainError(RawFrameCodecError::CorruptFile);
  }
  memcpy(&outHeader, outContent.data(), sizeof(RawFileHeader));
  size_t frameSize = static_cast<size_t>(outHeader.width) * outHeader.height * outHeader.channels;
  if (memcmp(outHeader.magic, kMagic, sizeof(kMagic)) != 0 || outHeader.fps <= 0 ||
      outContent.size() != sizeof(RawFileHeader) + frameSize * outHeader.frameCount) {
    return domainError(RawFrameCodecError::CorruptFile);
  }
  return SUCCESS;
}

} // namespace

namespace reshard::test {

const string& RawFrameCodec::staticName() {
  static const string sName = "RawFrameCodec";
  return sName;
}

int RawFrameCodec::decodeFrames(
    const string& path,
    const vector<SeekTime>& seekTimes,
    vector<VideoFrame>& outFrames) const {
  outFrames.clear();
  RawFileHeader header;
  string content;
  IF_ERROR_RETURN(readFile(path, header, content));
  const size_t frameSize = static_cast<size_t>(header.width) * header.height * header.channels;
  outFrames.reserve(seekTimes.size());
  for (SeekTime seekTime : seekTimes) {
    double position = round(seekTime.seconds() * header.fps);
    // A seek time up to one frame past either end of the file still finds the closest frame.
    if (!isfinite(position) || position < -1 || position > header.frameCount) {
      RS_LOGE("Seek time {} is outside of '{}'", seekTime.seconds(), path);
      outFrames.clear();
      return domainError(RawFrameCodecError::SeekOutOfRange);
    }
    int64_t frameIndex =
        min<int64_t>(max<int64_t>(static_cast<int64_t>(position), 0), header.frameCount - 1);
    VideoFrame frame;
    frame.width = header.width;
    frame.height = header.height;
    frame.channels = header.channels;
    const char* pixels = content.data() + sizeof(RawFileHeader) + frameIndex * frameSize;
    frame.pixels.assign(pixels, pixels + frameSize);
    outFrames.push_back(move(frame));
  }
  return SUCCESS;
}

int RawFrameCodec::encodeFrames(
    const string& path,
    const vector<VideoFrame>& frames,
    const VideoEncodeSettings& settings) const {
  if (frames.empty()) {
    return domainError(RawFrameCodecError::NoFrames);
  }
  const VideoFrame& first = frames.front();
  for (const VideoFrame& frame : frames) {
    if (!frame.isValid() || frame.width != first.width || frame.height != first.height ||
        frame.channels != first.channels) {
      return domainError(RawFrameCodecError::InconsistentFrames);
    }
  }
  RawFileHeader header;
  memcpy(header.magic, kMagic, sizeof(kMagic));
  header.width = first.width;
  header.height = first.height;
  header.channels = first.channels;
  header.frameCount = static_cast<uint32_t>(frames.size());
  header.fps = settings.fps;
  string content(reinterpret_cast<const char*>(&header), sizeof(header));
  content.reserve(sizeof(header) + first.expectedSize() * frames.size());
  for (const VideoFrame& frame : frames) {
    content.append(reinterpret_cast<const char*>(frame.pixels.data()), frame.pixels.size());
  }
  return os::writeTextFile(path, content);
}

int64_t RawFrameCodec::getFrameCount(const string& path) {
  RawFileHeader header;
  string content;
  return readFile(path, header, content) == 0 ? header.frameCount : -1;
}

VideoFrame makeTestFrame(uint32_t keySeed, uint32_t episodeIndex, uint32_t frameIndex) {
  VideoFrame frame;
  frame.width = 4;
  frame.height = 2;
  frame.channels = 3;
  frame.pixels.resize(frame.expectedSize());
  for (size_t k = 0; k < frame.pixels.size(); k++) {
    frame.pixels[k] = static_cast<uint8_t>(keySeed * 67 + episodeIndex * 31 + frameIndex * 7 + k);
  }
  return frame;
}

} // namespace reshard::test
