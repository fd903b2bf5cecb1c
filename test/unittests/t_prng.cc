/**
 * This file is part of libfastcdc.
 */

#include <gtest/gtest.h>

#include <cstring>

#include "util/prng.h"

namespace fastcdc {

class T_Prng : public ::testing::Test {
 protected:
  virtual void SetUp() {
    for (unsigned i = 0; i < rnd_range; ++i) {
      validation[i] = 0;
    }
  }

 protected:
  static const uint32_t buf_size = 100000;
  static const uint32_t rnd_range = 100;
  uint32_t buffer[buf_size];
  int32_t validation[rnd_range];
  Prng prng_;
};


TEST_F(T_Prng, FullRange) {
  uint32_t compare = rnd_range;
  for (unsigned i = 0; i < buf_size; ++i) {
    uint32_t random_number = prng_.Next(rnd_range);
    ASSERT_LT(random_number, compare);
    validation[random_number] = 1;
  }
  uint32_t test = 0;
  for (unsigned i = 0; i < rnd_range; ++i) {
    test += validation[i];
  }
  EXPECT_EQ(compare, test);
}


TEST_F(T_Prng, Deterministic) {
  prng_.InitSeed(7);
  for (unsigned i = 0; i < buf_size; ++i) {
    buffer[i] = prng_.Next(0xFFFFFFF);
  }
  prng_.InitSeed(7);
  for (unsigned i = 0; i < buf_size; ++i) {
    ASSERT_EQ(buffer[i], prng_.Next(0xFFFFFFF));
  }
}


TEST_F(T_Prng, FillBytes) {
  unsigned char first[4096];
  unsigned char second[4096];
  prng_.InitSeed(42);
  prng_.FillBytes(first, sizeof(first));
  prng_.InitSeed(42);
  prng_.FillBytes(second, sizeof(second));
  EXPECT_EQ(0, memcmp(first, second, sizeof(first)));

  unsigned histogram[256];
  memset(histogram, 0, sizeof(histogram));
  for (unsigned i = 0; i < sizeof(first); ++i)
    histogram[first[i]]++;
  unsigned distinct = 0;
  for (unsigned i = 0; i < 256; ++i) {
    if (histogram[i] > 0)
      distinct++;
  }
  EXPECT_GT(distinct, 200U);
}

}  // namespace fastcdc
