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

#include <reshard/utils/xxhash/xxhash.h>

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "xxhash"
#include <logging/Checks.h>

using namespace std;

namespace reshard {

XXH64Digester::XXH64Digester() {
  clear();
}

XXH64Digester::~XXH64Digester() {
  if (xxh_ != nullptr) {
    XXH64_freeState(xxh_);
    xxh_ = nullptr;
  }
}

void XXH64Digester::clear() {
  if (xxh_ == nullptr) {
    xxh_ = XXH64_createState();
    RS_CHECK_NOTNULL(xxh_);
  }
  RS_CHECK_EQ(XXH64_reset(xxh_, 0), XXH_OK);
}

XXH64Digester& XXH64Digester::ingest(const void* data, size_t len) {
  RS_CHECK_EQ(XXH64_update(xxh_, data, len), XXH_OK);
  return *this;
}

XXH64Digester& XXH64Digester::ingest(const map<string, vector<float>>& data) {
  for (const auto& iter : data) {
    ingest(iter.first);
    ingest(iter.second);
  }
  return *this;
}

uint64_t XXH64Digester::digest() {
  return XXH64_digest(xxh_);
}

string XXH64Digester::digestToString() {
  return fmt::format("{:016x}", digest());
}

} // namespace reshard
