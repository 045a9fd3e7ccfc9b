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

#include <cmath>

#include "gtest/gtest.h"
#include "dgim_utils.hpp"

using namespace std;
using namespace dgim;

class DgimUtilsTest : public ::testing::Test {

  virtual void SetUp() {
  }

  virtual void TearDown() {
  }
};

/**
 * Test isPowerOfTwo by looping over all the powers of two of a 64 bit integer
 */
TEST_F(DgimUtilsTest, TestIsPowerOfTwo) {
  EXPECT_FALSE(isPowerOfTwo(0));
  for(uint8_t n = 0; n < 64; n ++) {
    const uint64_t x = 1ULL << n;
    EXPECT_TRUE(isPowerOfTwo(x));
    if (n > 1) {
      EXPECT_FALSE(isPowerOfTwo(x + 1));
      EXPECT_FALSE(isPowerOfTwo(x - 1));
    }
  }
}

TEST_F(DgimUtilsTest, TestFloorLog2) {
  EXPECT_EQ(floorLog2(0), 0);
  for(uint64_t n = 1; n < 5000; n ++) {
    EXPECT_EQ(floorLog2(n), static_cast<uint8_t>(std::floor(std::log2(static_cast<double>(n)))));
  }
}

TEST_F(DgimUtilsTest, TestMaxNumberOfBuckets) {
  EXPECT_EQ(maxNumberOfBuckets(1, 2), 4u);
  EXPECT_EQ(maxNumberOfBuckets(100, 2), 16u);
  EXPECT_EQ(maxNumberOfBuckets(1024, 3), 36u);
}
