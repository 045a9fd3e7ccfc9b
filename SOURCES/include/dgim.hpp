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

#ifndef _DGIM_H_
#define _DGIM_H_

#include <deque>
#include <iostream>
#include <stdexcept>
#include <string>
#include <stdint.h>

#include "dgim_bucket.hpp"

#define DGIM_BUCKET_BOUND_DEFAULT_VALUE 2
#define DGIM_BUCKET_BOUND_MIN_VALUE 2
#define DGIM_BUCKET_BOUND_MAX_VALUE UINT32_MAX
#define DGIM_WINDOW_SIZE_MIN_VALUE 1

namespace dgim
{

struct InvalidConfiguration : public virtual std::runtime_error {
  InvalidConfiguration(const std::string& message) : std::runtime_error(message) {}
};

struct InvalidInput : public virtual std::runtime_error {
  InvalidInput(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Implementation of the DGIM algorithm. It estimates the number of ones
 * among the last windowSize elements of a binary stream while keeping only
 * O(bucketBound * log(windowSize)) buckets.
 *
 * Datar, Mayur, et al. "Maintaining stream statistics over sliding windows."
 * SIAM Journal on Computing 31.6 (2002): 1794-1813.
 *
 * Let c be the number of ones in the window and e the estimate. Then
 *
 *   |c - e| < c / bucketBound
 *
 * An instance is not thread safe, callers have to serialize access to it.
 */
class Dgim {
private:
  uint64_t windowSize;
  uint32_t bucketBound;
  uint64_t timestamp;

  // newest bucket first
  std::deque<Bucket> buckets;

  void evictExpiredBucket();
  void insertOne();

public:
  /**
   * windowSize is the number of most recent elements the count is made on,
   * bucketBound the maximum number of buckets of the same size. Throws
   * InvalidConfiguration if windowSize < 1 or bucketBound is not between 2
   * and DGIM_BUCKET_BOUND_MAX_VALUE. Both are signed so that negative values
   * are rejected instead of wrapping around.
   */
  Dgim(int64_t windowSize, int64_t bucketBound = DGIM_BUCKET_BOUND_DEFAULT_VALUE);

  /**
   * Push the next element of the stream.
   */
  void update(bool bit);

  /**
   * Same as above for an integer element. Anything else than 0 or 1 throws
   * InvalidInput and leaves the estimator untouched.
   */
  void update(int bit);

  /**
   * Estimate of the number of ones in the window. The oldest bucket still in
   * the window is assumed to be half inside it.
   */
  uint64_t estimateCount() const;

  /**
   * Maximum relative error made by estimateCount().
   */
  double errorRate() const;

  uint64_t getWindowSize() const {
    return windowSize;
  }

  uint32_t getBucketBound() const {
    return bucketBound;
  }

  uint64_t getTimestamp() const {
    return timestamp;
  }

  const std::deque<Bucket>& getBuckets() const {
    return buckets;
  }

  uint64_t getNumberOfBuckets() const {
    return buckets.size();
  }

  void printBuckets(std::ostream& os = std::cout) const;
};

} // namespace dgim

#endif
