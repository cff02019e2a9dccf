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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace reshard {

/// Helper class to handle a queue of jobs between threads.
/// This class doesn't know about threads, but its APIs are thread-safe,
/// allowing for both concurrent job producers, and concurrent job consumers.
template <class T>
class JobQueue {
  using milliseconds = std::chrono::milliseconds;
  using steady_clock = std::chrono::steady_clock;
  using time_point = std::chrono::time_point<std::chrono::steady_clock>;

 public:
  void sendJob(const T& value) {
    std::unique_lock<std::mutex> locker(mutex_);
    queue_.emplace_back(value);
    condition_.notify_one();
  }
  void sendJob(T&& value) {
    std::unique_lock<std::mutex> locker(mutex_);
    queue_.emplace_back(std::move(value));
    condition_.notify_one();
  }
  /// Wait for a job up to a specified wait time, or until the queue was ended
  bool waitForJobMs(T& outValue, int64_t waitTimeMs) {
    if (waitTimeMs <= 0) {
      return getJob(outValue);
    }
    time_point limit = steady_clock::now() + milliseconds(waitTimeMs);
    std::unique_lock<std::mutex> locker(mutex_);
    condition_.wait_until(locker, limit, [this]() { return hasEnded_ || !queue_.empty(); });
    return popLocked(outValue);
  }
  /// Wait for a job until one is available, or the queue was ended.
  /// Jobs still queued when the queue is ended are not returned.
  bool waitForJob(T& outValue) {
    while (!hasEnded_) {
      if (waitForJobMs(outValue, 5000)) {
        return true;
      }
    }
    return false;
  }
  /// get a pending job, if any, but don't wait
  bool getJob(T& outValue) {
    std::unique_lock<std::mutex> locker(mutex_);
    return popLocked(outValue);
  }
  void endQueue() {
    std::unique_lock<std::mutex> locker(mutex_);
    hasEnded_ = true;
    condition_.notify_all();
  }
  bool hasEnded() const {
    return hasEnded_;
  }
  void cancelAllQueuedJobs() {
    std::unique_lock<std::mutex> locker(mutex_);
    queue_.clear();
  }
  size_t getQueueSize() const {
    std::unique_lock<std::mutex> locker(mutex_);
    return queue_.size();
  }

 private:
  bool popLocked(T& outValue) {
    if (hasEnded_ || queue_.empty()) {
      return false;
    }
    outValue = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  std::deque<T> queue_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::atomic<bool> hasEnded_{false};
};

} // namespace reshard
