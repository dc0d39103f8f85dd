#include <cstdint>
#include <limits>
#include <string>

#include "bloom/bloom_filter.hpp"
#include "gtest/gtest.h"

namespace sketches {
namespace {

TEST(BloomFilterTest, ConstructorValidatesParameters) {
  EXPECT_THROW(BloomFilter<uint64_t>(0, 3), InvalidParameter);
  EXPECT_THROW(BloomFilter<uint64_t>(64, 0), InvalidParameter);
  EXPECT_THROW(BloomFilter<uint64_t>(std::numeric_limits<size_t>::max(), 3),
               InvalidParameter);
  EXPECT_THROW(BloomFilter<uint64_t>::ForFalsePositiveRate(0, 0.01),
               InvalidParameter);
  EXPECT_THROW(BloomFilter<uint64_t>::ForFalsePositiveRate(100, 0.0),
               InvalidParameter);
  EXPECT_THROW(BloomFilter<uint64_t>::ForFalsePositiveRate(100, 1.0),
               InvalidParameter);
}

TEST(BloomFilterTest, OptimalParameters) {
  EXPECT_EQ(BloomFilter<uint64_t>::OptimalNumBits(1000, 0.01), 9586u);
  EXPECT_EQ(BloomFilter<uint64_t>::OptimalNumHashes(9586, 1000), 7u);
  EXPECT_EQ(BloomFilter<uint64_t>::OptimalNumHashes(1, 1000), 1u);
}

TEST(BloomFilterTest, NoFalseNegatives) {
  auto filter = BloomFilter<uint64_t>::ForFalsePositiveRate(10000, 0.01);
  EXPECT_TRUE(filter.is_empty());
  for (uint64_t i = 0; i < 10000; ++i) filter.Insert(i);
  for (uint64_t i = 0; i < 10000; ++i) {
    EXPECT_TRUE(filter.Contains(i)) << i;
  }
  EXPECT_EQ(filter.inserted_items(), 10000u);
  EXPECT_FALSE(filter.is_empty());
}

TEST(BloomFilterTest, FalsePositiveRateIsNearTarget) {
  auto filter = BloomFilter<uint64_t>::ForFalsePositiveRate(10000, 0.01);
  for (uint64_t i = 0; i < 10000; ++i) filter.Insert(i);

  size_t false_positives = 0;
  for (uint64_t i = 1000000; i < 1010000; ++i) {
    false_positives += filter.Contains(i);
  }
  EXPECT_LT(false_positives, 300u);
  EXPECT_NEAR(filter.EstimatedFalsePositiveRate(), 0.01, 0.005);
}

TEST(BloomFilterTest, StringItems) {
  auto filter = BloomFilter<std::string>::ForFalsePositiveRate(100, 0.01);
  filter.Insert("alpha");
  filter.Insert("beta");
  EXPECT_TRUE(filter.Contains("alpha"));
  EXPECT_TRUE(filter.Contains("beta"));
}

TEST(BloomFilterTest, MergeIsUnion) {
  BloomFilter<uint64_t> left(4096, 5);
  BloomFilter<uint64_t> right(4096, 5);
  for (uint64_t i = 0; i < 200; ++i) left.Insert(i);
  for (uint64_t i = 200; i < 400; ++i) right.Insert(i);

  left.Merge(right);
  for (uint64_t i = 0; i < 400; ++i) EXPECT_TRUE(left.Contains(i));
  EXPECT_EQ(left.inserted_items(), 400u);
}

TEST(BloomFilterTest, MergeRejectsDifferentShape) {
  BloomFilter<uint64_t> left(4096, 5);
  BloomFilter<uint64_t> other_bits(2048, 5);
  BloomFilter<uint64_t> other_hashes(4096, 4);
  EXPECT_THROW(left.Merge(other_bits), IncompatibleSketches);
  EXPECT_THROW(left.Merge(other_hashes), IncompatibleSketches);
}

TEST(BloomFilterTest, ClearResetsState) {
  BloomFilter<uint64_t> filter(1024, 3);
  filter.Insert(1);
  filter.Clear();
  EXPECT_TRUE(filter.is_empty());
  EXPECT_FALSE(filter.Contains(1));
  EXPECT_EQ(filter.EstimatedFalsePositiveRate(), 0.0);
}

}  // namespace
}  // namespace sketches
