/*
Licensed to the Apache Software Foundation (ASF) under one
or more contributor license agreements.  See the NOTICE file
distributed with this work for additional information
regarding copyright ownership.  The ASF licenses this file
to you under the Apache License, Version 2.0 (the
"License"); you may not use this file except in compliance
with the License.  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the License is distributed on an
"AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
KIND, either express or implied.  See the License for the
specific language governing permissions and limitations
under the License.
*/

#include <string>

#include "dgim.hpp"

namespace dgim
{

Dgim::Dgim(int64_t windowSize, int64_t bucketBound) : timestamp(0) {
  if (windowSize < DGIM_WINDOW_SIZE_MIN_VALUE) {
    throw InvalidConfiguration("windowSize should be higher or equal to "
      + std::to_string(DGIM_WINDOW_SIZE_MIN_VALUE) + ". Got " + std::to_string(windowSize) + ".");
  }
  if (bucketBound < DGIM_BUCKET_BOUND_MIN_VALUE || bucketBound > static_cast<int64_t>(DGIM_BUCKET_BOUND_MAX_VALUE)) {
    throw InvalidConfiguration("bucketBound should be between "
      + std::to_string(DGIM_BUCKET_BOUND_MIN_VALUE) + " and " + std::to_string(DGIM_BUCKET_BOUND_MAX_VALUE)
      + ". Got " + std::to_string(bucketBound) + ".");
  }
  this->windowSize = static_cast<uint64_t>(windowSize);
  this->bucketBound = static_cast<uint32_t>(bucketBound);
}

void Dgim::update(int bit) {
  if (bit != 0 && bit != 1) {
    throw InvalidInput("stream elements have to be 0 or 1. Got " + std::to_string(bit) + ".");
  }
  update(bit == 1);
}

void Dgim::update(bool bit) {
  ++timestamp;
  evictExpiredBucket();
  if (bit) {
    insertOne();
  }
}

/**
 * The clock moves by one on every update and no two buckets share a
 * timestamp, so at most one bucket leaves the window per update.
 */
void Dgim::evictExpiredBucket() {
  if (!buckets.empty() && timestamp - buckets.back().mostRecentTimestamp >= windowSize) {
    buckets.pop_back();
  }
}

/**
 * Add a bucket of size 1 at the head, then walk the runs of equal-sized
 * buckets from the newest to the oldest. Whenever a run holds
 * bucketBound + 1 buckets, its two oldest buckets are merged. The merged
 * bucket sits right before the next run and is counted as its newest member,
 * so the merge can cascade to the next size. The walk stops at the first run
 * which is not over the bound since the runs after it are untouched.
 */
void Dgim::insertOne() {
  buckets.push_front(Bucket(timestamp, 1));

  size_t runStart = 0;
  while (runStart < buckets.size()) {
    const uint64_t runSize = buckets[runStart].oneCount;
    size_t runEnd = runStart;
    while (runEnd < buckets.size() && buckets[runEnd].oneCount == runSize) {
      ++runEnd;
    }
    if (runEnd - runStart <= bucketBound) {
      break;
    }
    // the run can not be longer than bucketBound + 1
    const size_t oldest = runEnd - 1;
    buckets[oldest - 1].merge(buckets[oldest]);
    buckets.erase(buckets.begin() + oldest);
    runStart = oldest - 1;
  }
}

uint64_t Dgim::estimateCount() const {
  uint64_t result = 0;
  uint64_t value = 0;
  for (const Bucket& bucket : buckets) {
    // stop at the first bucket which left the window
    if (timestamp - bucket.mostRecentTimestamp >= windowSize)
      break;
    value = bucket.oneCount;
    result += value;
  }
  // half of the oldest counted bucket is assumed to be out of the window
  return result - value / 2;
}

double Dgim::errorRate() const {
  return 1.0 / static_cast<double>(bucketBound);
}

void Dgim::printBuckets(std::ostream& os) const {
  for (const Bucket& bucket : buckets) {
    os << bucket << std::endl;
  }
}

} // namespace dgim
