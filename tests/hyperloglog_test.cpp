#include <cstdint>
#include <string>

#include "gtest/gtest.h"
#include "hll/hyperloglog.hpp"
#include "jaccard.hpp"

namespace sketches {
namespace {

HyperLogLog<uint64_t> SketchOfRange(uint8_t precision, uint64_t begin,
                                    uint64_t end) {
  HyperLogLog<uint64_t> hll(precision);
  for (uint64_t i = begin; i < end; ++i) hll.Add(i);
  return hll;
}

TEST(HyperLogLogTest, ConstructorValidatesPrecision) {
  EXPECT_THROW(HyperLogLog<uint64_t>(3), InvalidParameter);
  EXPECT_THROW(HyperLogLog<uint64_t>(19), InvalidParameter);
  EXPECT_EQ(HyperLogLog<uint64_t>(4).register_count(), 16u);
  EXPECT_EQ(HyperLogLog<uint64_t>(18).register_count(), 262144u);
}

TEST(HyperLogLogTest, PrecisionFromRelativeError) {
  EXPECT_EQ(HyperLogLog<uint64_t>::ForRelativeError(0.01).precision(), 14);
  EXPECT_EQ(HyperLogLog<uint64_t>::ForRelativeError(0.9).precision(), 4);
  EXPECT_EQ(HyperLogLog<uint64_t>::ForRelativeError(0.0001).precision(), 18);
  EXPECT_THROW(HyperLogLog<uint64_t>::ForRelativeError(0.0), InvalidParameter);
}

TEST(HyperLogLogTest, EmptySketch) {
  HyperLogLog<uint64_t> hll(12);
  EXPECT_TRUE(hll.is_empty());
  EXPECT_EQ(hll.Estimate(), 0.0);
  EXPECT_EQ(hll.Count(), 0u);
}

TEST(HyperLogLogTest, DuplicatesDoNotCount) {
  HyperLogLog<std::string> hll(12);
  for (int i = 0; i < 1000; ++i) hll.Add("same");
  EXPECT_EQ(hll.Count(), 1u);
}

TEST(HyperLogLogTest, EstimateIsAccurate) {
  for (const uint64_t n : {1000u, 100000u, 1000000u}) {
    const auto hll = SketchOfRange(14, 0, n);
    const double error = 4 * hll.ExpectedRelativeError();
    EXPECT_NEAR(hll.Estimate(), static_cast<double>(n), n * error) << n;
  }
}

TEST(HyperLogLogTest, MergeEqualsUnionStream) {
  const auto full = SketchOfRange(12, 0, 20000);
  auto left = SketchOfRange(12, 0, 10000);
  const auto right = SketchOfRange(12, 10000, 20000);
  left.Merge(right);
  EXPECT_EQ(left.registers(), full.registers());
  EXPECT_DOUBLE_EQ(left.Estimate(), full.Estimate());
}

TEST(HyperLogLogTest, MergeRejectsDifferentPrecision) {
  HyperLogLog<uint64_t> left(12);
  const HyperLogLog<uint64_t> right(13);
  EXPECT_THROW(left.Merge(right), IncompatibleSketches);
  EXPECT_THROW(left.JaccardIndex(right), IncompatibleSketches);
}

TEST(HyperLogLogTest, SetRelations) {
  const auto a = SketchOfRange(14, 0, 10000);
  const auto b = SketchOfRange(14, 5000, 15000);
  EXPECT_NEAR(a.UnionEstimate(b), 15000.0, 750.0);
  EXPECT_NEAR(a.IntersectionEstimate(b), 5000.0, 1000.0);
  EXPECT_NEAR(a.JaccardIndex(b), 1.0 / 3.0, 0.08);
}

TEST(HyperLogLogTest, IntersectionOfDisjointSetsIsClamped) {
  const auto a = SketchOfRange(12, 0, 1000);
  const auto b = SketchOfRange(12, 1000000, 1001000);
  const double intersection = a.IntersectionEstimate(b);
  EXPECT_GE(intersection, 0.0);
  EXPECT_LE(intersection, std::min(a.Estimate(), b.Estimate()));
}

TEST(HyperLogLogTest, JaccardOfEmptySketchesIsOne) {
  const HyperLogLog<uint64_t> a(10);
  const HyperLogLog<uint64_t> b(10);
  EXPECT_EQ(a.JaccardIndex(b), 1.0);
  EXPECT_EQ(JaccardIndex(a, b), 1.0);
}

TEST(HyperLogLogTest, ClearResetsState) {
  auto hll = SketchOfRange(10, 0, 100);
  hll.Clear();
  EXPECT_TRUE(hll.is_empty());
  EXPECT_EQ(hll.Estimate(), 0.0);
}

}  // namespace
}  // namespace sketches
