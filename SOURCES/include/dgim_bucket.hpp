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

#ifndef _DGIM_BUCKET_H_
#define _DGIM_BUCKET_H_

#include <algorithm>
#include <ostream>
#include <stdint.h>

namespace dgim
{

/**
 * A bucket summarizes a block of consecutive ones of the stream.
 *
 * mostRecentTimestamp is the position of the most recent one that belongs to
 * the bucket, oneCount is the number of ones it holds. oneCount is always a
 * power of two: buckets are created with a single one and only buckets of the
 * same size are merged together.
 */
struct Bucket {
  uint64_t mostRecentTimestamp;
  uint64_t oneCount;

  Bucket(uint64_t mostRecentTimestamp, uint64_t oneCount = 1) :
    mostRecentTimestamp(mostRecentTimestamp),
    oneCount(oneCount) {}

  /**
   * Absorb other into this bucket. Both buckets have to cover adjacent time
   * ranges and hold the same number of ones, otherwise the result is no
   * longer a power of two. This is not checked.
   */
  void merge(const Bucket& other) {
    mostRecentTimestamp = std::max(mostRecentTimestamp, other.mostRecentTimestamp);
    oneCount += other.oneCount;
  }

  bool operator==(const Bucket& other) const {
    return mostRecentTimestamp == other.mostRecentTimestamp && oneCount == other.oneCount;
  }

  bool operator!=(const Bucket& other) const {
    return !(*this == other);
  }
};

inline std::ostream& operator<<(std::ostream& os, const Bucket& bucket) {
  return os << "Bucket " << bucket.mostRecentTimestamp << ": " << bucket.oneCount;
}

} // namespace dgim

#endif
