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

#ifndef _DGIM_UTILS_H_
#define _DGIM_UTILS_H_

#include <stdint.h>

namespace dgim
{

inline bool isPowerOfTwo(uint64_t value) {
  return value != 0 && (value & (value - 1)) == 0;
}

/**
 * floor(log2(value)) for value > 0, 0 otherwise.
 */
inline uint8_t floorLog2(uint64_t value) {
  if (value == 0)
    return 0;
  // clz counts the leading zero bits starting from the MSB
  return static_cast<uint8_t>(63 - __builtin_clzll(value));
}

/**
 * Upper bound on the number of buckets an estimator keeps for a window of
 * windowSize elements. There are at most floorLog2(windowSize) + 1 distinct
 * bucket sizes in a window; we add one more size to account for the bucket
 * which straddles the window boundary, and each size appears at most
 * bucketBound times.
 */
inline uint64_t maxNumberOfBuckets(uint64_t windowSize, uint32_t bucketBound) {
  return static_cast<uint64_t>(bucketBound) * (floorLog2(windowSize) + 2);
}

} // namespace dgim

#endif
