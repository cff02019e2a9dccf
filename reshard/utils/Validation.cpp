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

#include <reshard/utils/Validation.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#define DEFAULT_LOG_CHANNEL "Validation"
#include <logging/Checks.h>
#include <logging/Log.h>

#include <reshard/ErrorCode.h>
#include <reshard/helpers/FileMacros.h>
#include <reshard/utils/FrameReader.h>
#include <reshard/utils/xxhash/xxhash.h>

using namespace std;

namespace {

using namespace reshard;
using namespace reshard::utils;

const double kTimestampTolerance = 1e-6;

class Checker {
 public:
  explicit Checker(ValidationReport& report) : report_{report} {}

  template <typename... Args>
  bool check(bool condition, fmt::format_string<Args...> format, Args&&... args) {
    report_.checkCount++;
    if (!condition) {
      string failure = fmt::format(format, std::forward<Args>(args)...);
      RS_LOGW("Check failed: {}", failure);
      report_.failures.push_back(move(failure));
    }
    return condition;
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> format, Args&&... args) {
    report_.warnings.push_back(fmt::format(format, std::forward<Args>(args)...));
    RS_LOGW("{}", report_.warnings.back());
  }

 private:
  ValidationReport& report_;
};

string tasksToString(const vector<string>& tasks) {
  return '[' + fmt::format("{}", fmt::join(tasks, ", ")) + ']';
}

void checkTotals(const Dataset& source, const Dataset& derived, Checker& checker) {
  const DatasetInfo& sourceInfo = source.getInfo();
  const DatasetInfo& derivedInfo = derived.getInfo();
  checker.check(
      sourceInfo.totalEpisodes == derivedInfo.totalEpisodes,
      "Episode count mismatch: {} vs {}",
      sourceInfo.totalEpisodes,
      derivedInfo.totalEpisodes);
  checker.check(
      sourceInfo.totalFrames == derivedInfo.totalFrames,
      "Frame count mismatch: {} vs {}",
      sourceInfo.totalFrames,
      derivedInfo.totalFrames);
  checker.check(
      sourceInfo.totalTasks == derivedInfo.totalTasks,
      "Task count mismatch: {} vs {}",
      sourceInfo.totalTasks,
      derivedInfo.totalTasks);
  checker.check(
      sourceInfo.fps == derivedInfo.fps,
      "FPS mismatch: {} vs {}",
      sourceInfo.fps,
      derivedInfo.fps);
}

void checkGlobalIndexes(const Dataset& derived, Checker& checker) {
  GlobalIndex expectedFrom{0};
  for (const EpisodeRecord& episode : derived.getEpisodes()) {
    if (!checker.check(
            episode.datasetFromIndex == expectedFrom &&
                episode.datasetToIndex == episode.datasetFromIndex.advancedBy(episode.length),
            "Episode {}: global indexes [{}, {}) don't follow {} for {} frames",
            episode.episodeIndex,
            episode.datasetFromIndex.value(),
            episode.datasetToIndex.value(),
            expectedFrom.value(),
            episode.length)) {
      return;
    }
    expectedFrom = episode.datasetToIndex;
  }
  checker.check(
      expectedFrom.value() == derived.getInfo().totalFrames,
      "Global indexes end at {}, but there are {} frames",
      expectedFrom.value(),
      derived.getInfo().totalFrames);
}

// Within a video shard, episode spans follow one another without overlapping.
// After a shuffle, they must be exactly chained, starting at 0.
void checkVideoTimestamps(const Dataset& derived, bool exactChaining, Checker& checker) {
  for (const string& key : derived.getVideoKeys()) {
    const VideoSpan* previous = nullptr;
    for (const EpisodeRecord& episode : derived.getEpisodes()) {
      const VideoSpan* span = episode.findVideo(key);
      if (span == nullptr) {
        continue;
      }
      bool newShard = previous == nullptr || previous->coordinate != span->coordinate;
      double expectedFrom = newShard ? 0 : previous->toTimestamp.seconds();
      double from = span->fromTimestamp.seconds();
      bool chained = exactChaining ? fabs(from - expectedFrom) < kTimestampTolerance
                                   : from > expectedFrom - kTimestampTolerance;
      checker.check(
          chained && span->duration() >= 0,
          "Episode {}: '{}' video span [{}, {}] doesn't follow {} in {}",
          episode.episodeIndex,
          key,
          from,
          span->toTimestamp.seconds(),
          expectedFrom,
          span->coordinate.toString());
      previous = span;
    }
  }
}

void checkAlignment(const Dataset& derived, const string& referenceKey, Checker& checker) {
  uint32_t misalignedCount = 0;
  for (const EpisodeRecord& episode : derived.getEpisodes()) {
    const VideoSpan* span = episode.findVideo(referenceKey);
    bool aligned = span != nullptr && episode.dataCoordinate == span->coordinate &&
        episode.metaCoordinate == span->coordinate;
    // only report the first few, as one problem often affects many episodes
    if (!aligned && ++misalignedCount <= 10) {
      checker.check(
          false,
          "Episode {}: data {} != video '{}' {} != meta {}",
          episode.episodeIndex,
          episode.dataCoordinate.toString(),
          referenceKey,
          span != nullptr ? span->coordinate.toString() : "<none>",
          episode.metaCoordinate.toString());
    }
  }
  checker.check(
      misalignedCount == 0, "{} episodes aren't aligned with '{}'", misalignedCount, referenceKey);
}

void checkSameOrder(const Dataset& source, const Dataset& derived, Checker& checker) {
  uint32_t count = min(source.getEpisodeCount(), derived.getEpisodeCount());
  for (uint32_t k = 0; k < count; k++) {
    const EpisodeRecord& sourceEpisode = *source.getEpisode(k);
    const EpisodeRecord& derivedEpisode = *derived.getEpisode(k);
    checker.check(
        sourceEpisode.length == derivedEpisode.length,
        "Episode {} length mismatch: {} vs {}",
        k,
        sourceEpisode.length,
        derivedEpisode.length);
    checker.check(
        sourceEpisode.tasks == derivedEpisode.tasks,
        "Episode {} tasks mismatch: {} vs {}",
        k,
        tasksToString(sourceEpisode.tasks),
        tasksToString(derivedEpisode.tasks));
  }
}

void checkShuffled(
    const Dataset& source,
    const Dataset& derived,
    uint32_t shuffleCheckEpisodeCount,
    Checker& checker) {
  vector<uint32_t> sourceLengths;
  vector<uint32_t> derivedLengths;
  map<vector<string>, int64_t> taskCounts;
  for (const EpisodeRecord& episode : source.getEpisodes()) {
    sourceLengths.push_back(episode.length);
    taskCounts[episode.tasks]++;
  }
  for (const EpisodeRecord& episode : derived.getEpisodes()) {
    derivedLengths.push_back(episode.length);
    taskCounts[episode.tasks]--;
  }
  sort(sourceLengths.begin(), sourceLengths.end());
  sort(derivedLengths.begin(), derivedLengths.end());
  checker.check(sourceLengths == derivedLengths, "Episode lengths don't match after sorting");
  checker.check(
      all_of(
          taskCounts.begin(),
          taskCounts.end(),
          [](const pair<const vector<string>, int64_t>& count) { return count.second == 0; }),
      "Task distribution changed");

  uint32_t episodeCount = min(source.getEpisodeCount(), derived.getEpisodeCount());
  if (episodeCount < 5) {
    checker.warn("Too few episodes to verify the shuffle.");
    return;
  }
  uint32_t compareCount = min(shuffleCheckEpisodeCount, episodeCount);
  vector<vector<string>> sourceTasks;
  vector<vector<string>> derivedTasks;
  for (uint32_t k = 0; k < compareCount; k++) {
    sourceTasks.push_back(source.getEpisode(k)->tasks);
    derivedTasks.push_back(derived.getEpisode(k)->tasks);
  }
  if (set<vector<string>>(sourceTasks.begin(), sourceTasks.end()).size() > 1) {
    checker.check(
        sourceTasks != derivedTasks,
        "The first {} episodes have the same tasks in the same order: not shuffled?",
        compareCount);
  } else {
    checker.warn("All the first episodes have the same tasks, can't verify the shuffle.");
  }
}

int checkContentDigests(
    const Dataset& source,
    const Dataset& derived,
    bool sameOrder,
    ProgressLogger& logger,
    Checker& checker) {
  const string stepName = "Comparing episode contents";
  uint32_t count = min(source.getEpisodeCount(), derived.getEpisodeCount());
  logger.logNewStep(stepName, 0, count);
  vector<string> sourceDigests(count);
  vector<string> derivedDigests(count);
  for (uint32_t k = 0; k < count; k++) {
    if (!logger.logProgress(stepName, k, count)) {
      return OPERATION_CANCELLED;
    }
    IF_ERROR_RETURN(episodeContentDigest(source, k, sourceDigests[k]));
    IF_ERROR_RETURN(episodeContentDigest(derived, k, derivedDigests[k]));
    if (sameOrder) {
      checker.check(
          sourceDigests[k] == derivedDigests[k],
          "Episode {} content mismatch: {} vs {}",
          k,
          sourceDigests[k],
          derivedDigests[k]);
    }
  }
  if (!sameOrder) {
    sort(sourceDigests.begin(), sourceDigests.end());
    sort(derivedDigests.begin(), derivedDigests.end());
    checker.check(
        sourceDigests == derivedDigests, "Some episodes have no matching content in the source");
  }
  return logger.logStatus(stepName) ? SUCCESS : OPERATION_CANCELLED;
}

int checkSampleFrames(
    const DatasetPtr& source,
    const DatasetPtr& derived,
    bool sameOrder,
    Checker& checker) {
  uint64_t frameCount = derived->getFrameCount();
  if (frameCount == 0) {
    return SUCCESS;
  }
  set<uint64_t> samples = {
      0, frameCount / 4, frameCount / 2, 3 * frameCount / 4, frameCount - 1};
  FrameReader sourceReader(source);
  FrameReader derivedReader(derived);
  const vector<double> deltas = {0};
  for (uint64_t sample : samples) {
    GlobalIndex index{sample};
    FrameSample derivedSample;
    IF_ERROR_RETURN(derivedReader.readFrame(index, deltas, derivedSample));
    for (const auto& keyFrames : derivedSample.videoFrames) {
      for (const VideoFrame& frame : keyFrames.second) {
        checker.check(
            frame.isValid(),
            "Frame {}: invalid '{}' video frame {}x{}x{}",
            sample,
            keyFrames.first,
            frame.width,
            frame.height,
            frame.channels);
      }
    }
    if (sameOrder) {
      if (!checker.check(
              sample < source->getFrameCount(), "Frame {} isn't in the source", sample)) {
        continue;
      }
      FrameSample sourceSample;
      IF_ERROR_RETURN(sourceReader.readFrame(index, deltas, sourceSample));
      checker.check(
          sourceSample.frame == derivedSample.frame, "Frame {} row content mismatch", sample);
      checker.check(
          sourceSample.videoFrames == derivedSample.videoFrames,
          "Frame {} video content mismatch",
          sample);
    }
  }
  return SUCCESS;
}

} // namespace

namespace reshard::utils {

int episodeContentDigest(const Dataset& dataset, uint32_t episodeIndex, string& outDigest) {
  vector<FrameRecord> frames;
  IF_ERROR_RETURN(dataset.readEpisodeFrames(episodeIndex, frames));
  XXH64Digester digester;
  for (const FrameRecord& frame : frames) {
    double timestamp = frame.timestamp.seconds();
    digester.ingest(static_cast<uint64_t>(frame.frameIndex))
        .ingest(&timestamp, sizeof(timestamp))
        .ingest(static_cast<uint64_t>(frame.taskIndex))
        .ingest(frame.features);
  }
  outDigest = digester.digestToString();
  return SUCCESS;
}

int validateDerivedDataset(
    const DatasetPtr& source,
    const DatasetPtr& derived,
    const ValidationOptions& options,
    ValidationReport& outReport,
    ProgressLogger* progressLogger) {
  RS_CHECK_NOTNULL(source);
  RS_CHECK_NOTNULL(derived);
  SilentLogger silentLogger;
  ProgressLogger& logger = progressLogger != nullptr ? *progressLogger : silentLogger;
  outReport = {};
  Checker checker(outReport);
  const bool sameOrder = options.derivedType == DerivedType::Aligned;
  logger.setStepCount(3);

  if (!logger.logNewStep("Checking metadata")) {
    return OPERATION_CANCELLED;
  }
  checkTotals(*source, *derived, checker);
  checkGlobalIndexes(*derived, checker);
  checkVideoTimestamps(*derived, !sameOrder, checker);
  if (sameOrder) {
    checkSameOrder(*source, *derived, checker);
  } else {
    checkShuffled(*source, *derived, options.shuffleCheckEpisodeCount, checker);
  }
  if (options.checkAlignment) {
    vector<string> videoKeys = derived->getVideoKeys();
    string referenceKey = options.referenceVideoKey;
    if (referenceKey.empty() && !videoKeys.empty()) {
      referenceKey = videoKeys.front();
    }
    if (checker.check(!referenceKey.empty(), "No video to check the alignment against")) {
      checkAlignment(*derived, referenceKey, checker);
    }
  }

  IF_ERROR_RETURN(checkContentDigests(*source, *derived, sameOrder, logger, checker));

  if (options.decodeSampleFrames) {
    if (!logger.logNewStep("Decoding sample frames")) {
      return OPERATION_CANCELLED;
    }
    IF_ERROR_RETURN(checkSampleFrames(source, derived, sameOrder, checker));
  }
  if (outReport.isValid()) {
    RS_LOGI("All {} checks passed.", outReport.checkCount);
  } else {
    RS_LOGE("{} of {} checks failed.", outReport.failures.size(), outReport.checkCount);
  }
  return SUCCESS;
}

} // namespace reshard::utils
