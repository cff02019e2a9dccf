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

#ifdef logError
#undef logError
#endif

namespace reshard {

using std::string;

/// \brief ProgressLogger class to be notified of the progress of a long dataset operation.
///
/// Used by the shard aligner, the episode shuffler and the validation checks.
/// By default, logs using RS_LOGI and RS_LOGE, but can be easily overwritten to log anywhere.
/// By default, this class never requests to stop the operation, but that can be overridden, which
/// is how long operations are cancelled: they then return OPERATION_CANCELLED before publishing
/// anything.
/// Operations only call their logger from the thread that called them.
class ProgressLogger {
 public:
  static constexpr double kDefaultUpdateDelay = 2;
  /// By default, only logs every 2 seconds.
  /// @param detailedProgress: pass true to log every new step, regardless of timing.
  /// @param updateDelay: time in seconds between updates.
  explicit ProgressLogger(bool detailedProgress = false, double updateDelay = kDefaultUpdateDelay);
  virtual ~ProgressLogger();

  /// Set the number of steps anticipated, if expecting more than one step.
  /// @param stepCount: total number of steps anticipated.
  virtual void setStepCount(int stepCount);

  /// Start logging a new step.
  /// @param stepName: the name of the step.
  /// @param progress: the current progress in the step.
  /// @param maxProgress: the max value of the progress counter in the step.
  /// @return True if the operation should continue, false if it should be cancelled.
  virtual bool logNewStep(const string& stepName, size_t progress = 0, size_t maxProgress = 100);

  /// Log progress of a step that has an internal progress counter.
  /// logNewStep() should always be called first.
  /// @return True if the operation should continue, false if it should be cancelled.
  bool logProgress(const string& stepName, size_t progress = 0, size_t maxProgress = 100) {
    return logProgress(stepName, progress, maxProgress, false);
  }

  /// Log that a step is completed, with a specific status.
  /// @param stepName: the name of the step.
  /// @param status: 0 on success, otherwise, the step is considered failed.
  /// @return True if the operation should continue, false if it should be cancelled.
  virtual bool logStatus(const string& stepName, int status = 0);

  /// Log that an operation was performed in a specific duration.
  /// @param operationName: text describing the operation.
  /// @param duration: number of seconds the operation lasted.
  /// @return True if the operation should continue, false if it should be cancelled.
  virtual bool logDuration(const string& operationName, double duration);

  /// Callback to tell if the operation should stop or keep going.
  /// Override this method to check if the operation should be cancelled.
  /// @return True if the operation should continue, false if it should be cancelled.
  virtual bool shouldKeepGoing();

 protected:
  virtual bool
  logProgress(const string& stepName, size_t progress, size_t maxProgress, bool newStep);
  /// Log an actual message, after all the filtering logic has been applied.
  virtual void logMessage(const string& message);
  /// Log an error message, after all the filtering logic has been applied.
  virtual void logError(const string& message);
  /// Callback to update the current step's progress, for instance, when displaying a progress bar.
  virtual void updateStep(size_t progress = 0, size_t maxProgress = 100);
  virtual void updateNextProgressTime();

 protected:
  bool detailedProgress_;
  double updateDelay_;
  int stepNumber_;
  int stepCount_;
  double nextProgressTime_;
};

/// \brief Progress logger to ignore all progress notifications.
class SilentLogger : public ProgressLogger {
 public:
  ~SilentLogger() override;
  bool logProgress(const string&, size_t = 0, size_t = 100, bool = false) override {
    return shouldKeepGoing();
  }
  bool logStatus(const string&, int = 0) override {
    return shouldKeepGoing();
  }
  bool logDuration(const string& /*operationName*/, double /*duration*/) override {
    return shouldKeepGoing();
  }
};

} // namespace reshard
