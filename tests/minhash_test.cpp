#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#include "gtest/gtest.h"
#include "hll/hyperloglog.hpp"
#include "jaccard.hpp"
#include "minhash/minhash.hpp"

namespace sketches {
namespace {

MinHash<uint64_t> SignatureOfRange(size_t num_hashes, uint64_t begin,
                                   uint64_t end) {
  MinHash<uint64_t> minhash(num_hashes);
  for (uint64_t i = begin; i < end; ++i) minhash.Add(i);
  return minhash;
}

TEST(MinHashTest, ConstructorValidatesNumHashes) {
  EXPECT_THROW(MinHash<uint64_t>(0), InvalidParameter);
  EXPECT_EQ(MinHash<uint64_t>(64).num_hashes(), 64u);
}

TEST(MinHashTest, NumHashesFromStandardError) {
  const auto minhash = MinHash<uint64_t>::ForStandardError(0.1);
  EXPECT_EQ(minhash.num_hashes(), 100u);
  EXPECT_NEAR(minhash.ExpectedError(), 0.1, 1e-12);
  EXPECT_THROW(MinHash<uint64_t>::ForStandardError(0.0), InvalidParameter);
  EXPECT_THROW(MinHash<uint64_t>::ForStandardError(1e-200), InvalidParameter);
}

TEST(MinHashTest, EmptySignatureIsAllMax) {
  const MinHash<uint64_t> minhash(16);
  EXPECT_TRUE(minhash.is_empty());
  for (const uint64_t slot : minhash.signature()) {
    EXPECT_EQ(slot, minhash_constants::kEmptySlot);
  }
}

TEST(MinHashTest, OverlapEstimate) {
  const auto left = SignatureOfRange(256, 0, 10000);
  const auto right = SignatureOfRange(256, 5000, 15000);
  EXPECT_NEAR(left.EstimateJaccard(right), 1.0 / 3.0, 0.15);
}

TEST(MinHashTest, IdenticalStreamsAreSimilar) {
  const auto left = SignatureOfRange(128, 0, 5000);
  const auto right = SignatureOfRange(128, 0, 5000);
  EXPECT_GT(left.EstimateJaccard(right), 0.9);
}

TEST(MinHashTest, EmptySemantics) {
  MinHash<std::string> empty(64);
  MinHash<std::string> other_empty(64);
  MinHash<std::string> filled(64);
  filled.Add("x");
  EXPECT_EQ(empty.EstimateJaccard(other_empty), 1.0);
  EXPECT_EQ(empty.EstimateJaccard(filled), 0.0);
  EXPECT_EQ(filled.EstimateJaccard(empty), 0.0);
}

TEST(MinHashTest, MergeIsElementwiseMinimum) {
  const auto left = SignatureOfRange(64, 0, 1000);
  const auto right = SignatureOfRange(64, 500, 1500);
  auto merged = left;
  merged.Merge(right);
  for (size_t i = 0; i < merged.num_hashes(); ++i) {
    EXPECT_EQ(merged.signature()[i],
              std::min(left.signature()[i], right.signature()[i]));
  }
  EXPECT_EQ(merged.EstimateJaccard(SignatureOfRange(64, 0, 1500)), 1.0);
}

TEST(MinHashTest, MergeWithEmptyKeepsObservation) {
  MinHash<uint64_t> empty(32);
  empty.Merge(SignatureOfRange(32, 0, 10));
  EXPECT_FALSE(empty.is_empty());
}

TEST(MinHashTest, RejectsIncompatibleSketches) {
  auto left = SignatureOfRange(64, 0, 10);
  const auto right = SignatureOfRange(65, 0, 10);
  EXPECT_THROW(left.Merge(right), IncompatibleSketches);
  EXPECT_THROW(left.EstimateJaccard(right), IncompatibleSketches);
}

TEST(MinHashTest, ClearResetsState) {
  auto minhash = SignatureOfRange(32, 0, 100);
  minhash.Clear();
  EXPECT_TRUE(minhash.is_empty());
  EXPECT_EQ(minhash.signature()[0], minhash_constants::kEmptySlot);
}

TEST(JaccardEstimatorTest, BothSketchesSatisfyTheCapability) {
  static_assert(JaccardEstimator<MinHash<uint64_t>>);
  static_assert(JaccardEstimator<HyperLogLog<uint64_t>>);
  static_assert(!JaccardEstimator<uint64_t>);

  const auto left = SignatureOfRange(128, 0, 5000);
  const auto right = SignatureOfRange(128, 2500, 7500);
  const double similarity = JaccardIndex(left, right);
  EXPECT_GT(similarity, 0.2);
  EXPECT_LT(similarity, 0.6);

  HyperLogLog<uint64_t> hll_left(12);
  HyperLogLog<uint64_t> hll_right(12);
  for (uint64_t i = 0; i < 5000; ++i) hll_left.Add(i);
  for (uint64_t i = 2500; i < 7500; ++i) hll_right.Add(i);
  const double hll_similarity = JaccardIndex(hll_left, hll_right);
  EXPECT_GT(hll_similarity, 0.2);
  EXPECT_LT(hll_similarity, 0.6);
}

}  // namespace
}  // namespace sketches
