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

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <thread>
#include <vector>

#include <reshard/helpers/JobQueue.h>

using namespace std;
using namespace reshard;

namespace {

struct JobQueueTest : testing::Test {};

} // namespace

TEST_F(JobQueueTest, basics) {
  JobQueue<int> queue;
  int value = 0;
  EXPECT_FALSE(queue.getJob(value));
  EXPECT_FALSE(queue.waitForJobMs(value, 1));
  queue.sendJob(1);
  queue.sendJob(2);
  EXPECT_EQ(queue.getQueueSize(), 2);
  EXPECT_TRUE(queue.waitForJobMs(value, 1));
  EXPECT_EQ(value, 1);
  EXPECT_TRUE(queue.getJob(value));
  EXPECT_EQ(value, 2);
  queue.sendJob(3);
  queue.cancelAllQueuedJobs();
  EXPECT_FALSE(queue.getJob(value));

  queue.sendJob(4);
  queue.endQueue();
  EXPECT_TRUE(queue.hasEnded());
  // queued jobs are dropped once the queue has ended
  EXPECT_FALSE(queue.waitForJob(value));
  EXPECT_EQ(value, 2);
}

TEST_F(JobQueueTest, movableJobs) {
  JobQueue<unique_ptr<string>> queue;
  queue.sendJob(make_unique<string>("videos/chunk-000/file-000.mp4"));
  unique_ptr<string> job;
  ASSERT_TRUE(queue.getJob(job));
  ASSERT_TRUE(job);
  EXPECT_EQ(*job, "videos/chunk-000/file-000.mp4");
}

TEST_F(JobQueueTest, threads) {
  const size_t kJobCount = 1000;
  JobQueue<int> jobs;
  JobQueue<int> results;
  vector<thread> workers;
  for (int k = 0; k < 4; k++) {
    workers.emplace_back([&jobs, &results] {
      int job = 0;
      while (jobs.waitForJob(job)) {
        results.sendJob(job * 2);
      }
    });
  }
  for (size_t k = 0; k < kJobCount; k++) {
    jobs.sendJob(static_cast<int>(k));
  }
  set<int> received;
  int result = 0;
  while (received.size() < kJobCount && results.waitForJobMs(result, 10000)) {
    received.insert(result);
  }
  jobs.endQueue();
  for (thread& worker : workers) {
    worker.join();
  }
  ASSERT_EQ(received.size(), kJobCount);
  EXPECT_EQ(*received.begin(), 0);
  EXPECT_EQ(*received.rbegin(), 2 * static_cast<int>(kJobCount - 1));
}
