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

#ifndef _DGIM_BIT_STREAM_H_
#define _DGIM_BIT_STREAM_H_

#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include <stdint.h>

namespace dgim
{

static const uint32_t DGIM_STREAM_DEFAULT_SEED = 27072015;

/**
 * Reproducible source of pseudo-random bits. Each bit is 1 with probability
 * oneProbability, independently of the others. Two streams built with the
 * same seed and probability yield the same sequence.
 */
class RandomBitStream {
  std::mt19937 rng;
  std::bernoulli_distribution distribution;

public:
  explicit RandomBitStream(uint32_t seed = DGIM_STREAM_DEFAULT_SEED, double oneProbability = 0.5) :
    rng(seed), distribution(checkProbability(oneProbability)) {}

  bool next() {
    return distribution(rng);
  }

  std::vector<bool> take(size_t length) {
    std::vector<bool> bits;
    bits.reserve(length);
    for (size_t i = 0; i < length; ++i) {
      bits.push_back(next());
    }
    return bits;
  }

private:
  static double checkProbability(double oneProbability) {
    if (!(oneProbability >= 0.0 && oneProbability <= 1.0)) {
      throw std::invalid_argument("oneProbability has to be between 0 and 1. Got "
        + std::to_string(oneProbability) + ".");
    }
    return oneProbability;
  }
};

} // namespace dgim

#endif
