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

#ifndef _DGIM_EXACT_WINDOW_COUNTER_H_
#define _DGIM_EXACT_WINDOW_COUNTER_H_

#include <deque>
#include <stdint.h>

namespace dgim
{

/**
 * Exact number of ones among the last windowSize bits. It keeps the whole
 * window in memory and serves as the reference the estimates are compared to.
 */
class ExactWindowCounter {
  uint64_t windowSize;
  uint64_t count;
  std::deque<bool> window;

public:
  explicit ExactWindowCounter(uint64_t windowSize) : windowSize(windowSize), count(0) {}

  void update(bool bit) {
    window.push_back(bit);
    count += bit;
    if (window.size() > windowSize) {
      count -= window.front();
      window.pop_front();
    }
  }

  uint64_t getCount() const {
    return count;
  }
};

} // namespace dgim

#endif
