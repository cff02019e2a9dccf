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

#include <reshard/utils/EpisodeShuffler.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iterator>
#include <map>
#include <memory>
#include <random>
#include <thread>

#define DEFAULT_LOG_CHANNEL "EpisodeShuffler"
#include <logging/Checks.h>
#include <logging/Log.h>

#include <reshard/DatasetWriter.h>
#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/helpers/JobQueue.h>
#include <reshard/os/Time.h>

using namespace std;

namespace {

using namespace reshard;

/// Episodes packed in the same output shard, for all stores.
struct OutputShard {
  ShardCoordinate coordinate;
  /// new episode indexes
  vector<uint32_t> episodeIndexes;
};

struct ShufflePlan {
  vector<uint32_t> permutation;
  vector<EpisodeRecord> episodes;
  vector<OutputShard> shards;
};

// Unbiased random integer in [0, bound)
uint64_t uniformBelow(mt19937_64& generator, uint64_t bound) {
  const uint64_t threshold = (0 - bound) % bound;
  uint64_t value;
  do {
    value = generator();
  } while (value < threshold);
  return value % bound;
}

void planShuffle(
    const Dataset& source,
    const vector<uint32_t>& permutation,
    uint32_t maxFramesPerFile,
    ShufflePlan& outPlan) {
  const uint32_t chunksSize = source.getInfo().chunksSize;
  outPlan.permutation = permutation;
  outPlan.episodes.clear();
  outPlan.shards.clear();
  outPlan.episodes.reserve(permutation.size());
  GlobalIndex nextIndex{0};
  ShardCoordinate coordinate;
  uint64_t shardFrameCount = 0;
  map<string, double> shardVideoTimes;
  for (uint32_t newIndex = 0; newIndex < permutation.size(); newIndex++) {
    const EpisodeRecord& original = *source.getEpisode(permutation[newIndex]);
    if (outPlan.shards.empty()) {
      outPlan.shards.emplace_back();
      outPlan.shards.back().coordinate = coordinate;
    } else if (shardFrameCount > 0 && shardFrameCount + original.length > maxFramesPerFile) {
      coordinate = coordinate.next(chunksSize);
      outPlan.shards.emplace_back();
      outPlan.shards.back().coordinate = coordinate;
      shardFrameCount = 0;
      shardVideoTimes.clear();
    }
    outPlan.shards.back().episodeIndexes.push_back(newIndex);
    shardFrameCount += original.length;

    EpisodeRecord episode;
    episode.episodeIndex = newIndex;
    episode.datasetFromIndex = nextIndex;
    episode.datasetToIndex = nextIndex.advancedBy(original.length);
    episode.length = original.length;
    episode.tasks = original.tasks;
    episode.dataCoordinate = coordinate;
    episode.metaCoordinate = coordinate;
    // an episode's span keeps its duration, wherever it is moved
    for (const auto& video : original.videos) {
      double& fromTimestamp = shardVideoTimes[video.first];
      VideoSpan& span = episode.videos[video.first];
      span.coordinate = coordinate;
      span.fromTimestamp = SeekTime(fromTimestamp);
      span.toTimestamp = SeekTime(fromTimestamp + video.second.duration());
      fromTimestamp = span.toTimestamp.seconds();
    }
    nextIndex = episode.datasetToIndex;
    outPlan.episodes.push_back(move(episode));
  }
}

/// Decode the frames of the episodes of an output video shard, and encode them in a new file.
class EncodeJob {
 public:
  EncodeJob(
      const Dataset& source,
      DatasetWriter& writer,
      const OutputShard& shard,
      const string& videoKey,
      const ShufflePlan& plan,
      const VideoEncodeSettings& settings,
      const atomic<bool>& cancelled)
      : source_{source},
        writer_{writer},
        shard_{shard},
        videoKey_{videoKey},
        plan_{plan},
        settings_{settings},
        cancelled_{cancelled} {}

  int performJob() {
    const VideoCodec& codec = *source_.getBackends().video;
    vector<VideoFrame> frames;
    for (uint32_t newIndex : shard_.episodeIndexes) {
      uint32_t sourceIndex = plan_.permutation[newIndex];
      const VideoSpan* span = source_.getEpisode(sourceIndex)->findVideo(videoKey_);
      if (span == nullptr) {
        continue;
      }
      if (cancelled_) {
        return OPERATION_CANCELLED;
      }
      vector<SeekTime> seekTimes;
      IF_ERROR_RETURN(
          source_.getResolver().resolveEpisodeFrames(sourceIndex, videoKey_, seekTimes));
      string path =
          source_.getPath(source_.getLayout().videoFilePath(videoKey_, span->coordinate));
      vector<VideoFrame> episodeFrames;
      int status = codec.decodeFrames(path, seekTimes, episodeFrames);
      if (status != 0 || episodeFrames.size() != seekTimes.size()) {
        RS_LOGE(
            "Can't decode episode {} from '{}': {}",
            sourceIndex,
            path,
            errorCodeToMessage(status != 0 ? status : MEDIA_DECODE_ERROR));
        return status != 0 && isMediaCodecError(status) ? status : MEDIA_DECODE_ERROR;
      }
      move(episodeFrames.begin(), episodeFrames.end(), back_inserter(frames));
    }
    if (frames.empty()) {
      return SUCCESS;
    }
    if (cancelled_) {
      return OPERATION_CANCELLED;
    }
    return writer_.encodeVideo(
        source_.getLayout().videoFilePath(videoKey_, shard_.coordinate), frames, settings_);
  }

  const string& getVideoKey() const {
    return videoKey_;
  }

 private:
  const Dataset& source_;
  DatasetWriter& writer_;
  const OutputShard& shard_;
  const string videoKey_;
  const ShufflePlan& plan_;
  const VideoEncodeSettings& settings_;
  const atomic<bool>& cancelled_;
};

using EncodeJobQueue = JobQueue<unique_ptr<EncodeJob>>;

class EncoderThreadsPool {
 public:
  EncoderThreadsPool(size_t threadCount) {
    threads_.reserve(threadCount);
    while (threads_.size() < threadCount) {
      threads_.emplace_back(&EncoderThreadsPool::threadActivity, this, threads_.size());
    }
  }
  ~EncoderThreadsPool() {
    cancelled_ = true;
    jobs_.cancelAllQueuedJobs();
    jobs_.endQueue();
    for (auto& thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  void sendJob(unique_ptr<EncodeJob>&& job) {
    jobs_.sendJob(move(job));
  }
  bool waitForResultMs(int& outStatus, int64_t waitTimeMs) {
    return results_.waitForJobMs(outStatus, waitTimeMs);
  }
  const atomic<bool>& getCancelled() const {
    return cancelled_;
  }
  void cancel() {
    cancelled_ = true;
    jobs_.cancelAllQueuedJobs();
  }

 private:
  void threadActivity(size_t threadIndex) {
    RS_LOGD("Starting encoder thread #{}", threadIndex + 1);
    unique_ptr<EncodeJob> job;
    while (jobs_.waitForJob(job)) {
      results_.sendJob(cancelled_ ? OPERATION_CANCELLED : job->performJob());
      job.reset();
    }
    RS_LOGD("Encoder thread #{} ended.", threadIndex + 1);
  }

  EncodeJobQueue jobs_;
  JobQueue<int> results_;
  atomic<bool> cancelled_{false};
  vector<thread> threads_;
};

int writeTables(
    const Dataset& source,
    const ShufflePlan& plan,
    DatasetWriter& writer,
    ProgressLogger& logger,
    vector<string>& outDataFiles) {
  const DatasetLayout& layout = source.getLayout();
  const string stepName = "Writing data shards";
  logger.logNewStep(stepName, 0, plan.shards.size());
  for (size_t s = 0; s < plan.shards.size(); s++) {
    if (!logger.logProgress(stepName, s, plan.shards.size())) {
      return OPERATION_CANCELLED;
    }
    const OutputShard& shard = plan.shards[s];
    vector<FrameRecord> shardFrames;
    vector<EpisodeRecord> shardEpisodes;
    for (uint32_t newIndex : shard.episodeIndexes) {
      const EpisodeRecord& episode = plan.episodes[newIndex];
      vector<FrameRecord> frames;
      IF_ERROR_RETURN(source.readEpisodeFrames(plan.permutation[newIndex], frames));
      for (FrameRecord& frame : frames) {
        frame.index = episode.datasetFromIndex.advancedBy(frame.frameIndex);
        frame.episodeIndex = newIndex;
        shardFrames.push_back(move(frame));
      }
      shardEpisodes.push_back(episode);
    }
    string dataPath = layout.dataFilePath(shard.coordinate);
    IF_ERROR_RETURN(writer.writeFrames(dataPath, shardFrames));
    IF_ERROR_RETURN(writer.writeEpisodes(layout.episodesFilePath(shard.coordinate), shardEpisodes));
    outDataFiles.push_back(dataPath);
  }
  return logger.logStatus(stepName) ? SUCCESS : OPERATION_CANCELLED;
}

int encodeVideos(
    const Dataset& source,
    const ShufflePlan& plan,
    const utils::ShuffleOptions& options,
    DatasetWriter& writer,
    ProgressLogger& logger,
    vector<string>& outDataFiles) {
  VideoEncodeSettings settings = options.encodeSettings;
  settings.fps = source.getFps();
  size_t threadCount = options.workerThreadCount > 0
      ? options.workerThreadCount
      : max<unsigned>(thread::hardware_concurrency(), 1);
  EncoderThreadsPool pool(threadCount);
  size_t jobCount = 0;
  for (const OutputShard& shard : plan.shards) {
    for (const string& key : source.getVideoKeys()) {
      pool.sendJob(make_unique<EncodeJob>(
          source, writer, shard, key, plan, settings, pool.getCancelled()));
      jobCount++;
    }
  }
  // the tables are written while the videos are encoded
  int status = writeTables(source, plan, writer, logger, outDataFiles);
  const string stepName = "Encoding videos";
  logger.logNewStep(stepName, 0, jobCount);
  size_t completedCount = 0;
  while (status == 0 && completedCount < jobCount) {
    int jobStatus = 0;
    if (pool.waitForResultMs(jobStatus, 100)) {
      completedCount++;
      status = jobStatus;
    }
    if (!logger.logProgress(stepName, completedCount, jobCount)) {
      status = OPERATION_CANCELLED;
    }
  }
  if (status != 0) {
    pool.cancel();
    RS_LOGE("Shuffle aborted: {}", errorCodeToMessage(status));
    return status;
  }
  return logger.logStatus(stepName) ? SUCCESS : OPERATION_CANCELLED;
}

} // namespace

namespace reshard::utils {

uint32_t ShuffleOptions::getMaxFramesPerFile(double fps) const {
  if (maxFramesPerFile > 0) {
    return maxFramesPerFile;
  }
  double frames = floor(targetFileDurationSec * fps);
  return frames >= 1 ? static_cast<uint32_t>(min<double>(frames, UINT32_MAX)) : 1;
}

vector<uint32_t> makeEpisodePermutation(uint32_t count, uint64_t seed) {
  vector<uint32_t> permutation(count);
  for (uint32_t k = 0; k < count; k++) {
    permutation[k] = k;
  }
  mt19937_64 generator(seed);
  for (uint32_t k = count; k > 1; k--) {
    swap(permutation[k - 1], permutation[uniformBelow(generator, k)]);
  }
  return permutation;
}

int shuffleEpisodes(
    const DatasetPtr& source,
    uint64_t seed,
    const string& outputPath,
    const ShuffleOptions& options,
    DatasetPtr& outDataset,
    ProgressLogger* progressLogger) {
  RS_CHECK_NOTNULL(source);
  if (source->getEpisodeCount() < 2) {
    RS_LOGI("Less than 2 episodes: nothing to shuffle.");
    outDataset = source;
    return SUCCESS;
  }
  SilentLogger silentLogger;
  ProgressLogger& logger = progressLogger != nullptr ? *progressLogger : silentLogger;
  double startTime = os::getTimestampSec();
  logger.setStepCount(4);

  ShufflePlan plan;
  planShuffle(
      *source,
      makeEpisodePermutation(source->getEpisodeCount(), seed),
      options.getMaxFramesPerFile(source->getFps()),
      plan);
  RS_LOGI(
      "Shuffling {} episodes into {} shards, with seed {}.",
      plan.episodes.size(),
      plan.shards.size(),
      seed);

  DatasetWriter writer(outputPath, source->getBackends());
  IF_ERROR_RETURN(writer.create());
  vector<string> dataFiles;
  IF_ERROR_RETURN(encodeVideos(*source, plan, options, writer, logger, dataFiles));
  if (options.copyMetaFiles) {
    IF_ERROR_RETURN(writer.copyMetaFiles(*source));
  }

  if (!logger.logNewStep("Writing manifest")) {
    return OPERATION_CANCELLED;
  }
  ShardManifest manifest;
  IF_ERROR_LOG_AND_RETURN(
      manifest.build(plan.episodes, source->getLayout(), writer.getStagingPath()));
  IF_ERROR_RETURN(writer.writeManifest(manifest));
  DatasetInfo info = source->getInfo();
  if (!info.dataFiles.empty()) {
    info.dataFiles = dataFiles;
  }
  IF_ERROR_RETURN(writer.writeInfo(info));

  if (!logger.logNewStep("Publishing")) {
    return OPERATION_CANCELLED;
  }
  IF_ERROR_RETURN(writer.publish());
  logger.logDuration("Shuffle", os::getTimestampSec() - startTime);

  Dataset::OpenOptions openOptions;
  openOptions.backends = source->getBackends();
  return Dataset::open(outputPath, outDataset, openOptions);
}

} // namespace reshard::utils
