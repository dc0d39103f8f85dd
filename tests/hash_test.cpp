#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"
#include "hash.hpp"
#include "saturating.hpp"

namespace sketches {
namespace {

TEST(HashTest, SeededHashIsDeterministic) {
  EXPECT_EQ(SeededHash(uint64_t{42}, 7), SeededHash(uint64_t{42}, 7));
  EXPECT_EQ(SeededHash(std::string("sketch"), 7),
            SeededHash(std::string("sketch"), 7));
}

TEST(HashTest, SeedChangesHash) {
  EXPECT_NE(SeededHash(uint64_t{42}, 1), SeededHash(uint64_t{42}, 2));
  // Seeds that only differ in their upper half must not collide.
  EXPECT_NE(SeededHash(uint64_t{42}, uint64_t{1} << 40),
            SeededHash(uint64_t{42}, 0));
}

TEST(HashTest, StringsHashByCharacters) {
  const std::string owned = "hello";
  const std::string_view view = owned;
  const char* c_string = "hello";
  EXPECT_EQ(SeededHash(owned, 3), SeededHash(view, 3));
  EXPECT_EQ(SeededHash(owned, 3), SeededHash(c_string, 3));
  EXPECT_NE(SeededHash(owned, 3), SeededHash(std::string("hellp"), 3));
}

TEST(HashTest, SignedZeroHashesEqual) {
  EXPECT_EQ(SeededHash(0.0, 11), SeededHash(-0.0, 11));
  EXPECT_EQ(SeededHash(0.0f, 11), SeededHash(-0.0f, 11));
  EXPECT_NE(SeededHash(1.0, 11), SeededHash(-1.0, 11));
}

TEST(HashTest, ContiguousRangesHashTheirBytes) {
  const std::vector<uint64_t> values = {1, 2, 3, 4};
  const std::vector<uint64_t> same = {1, 2, 3, 4};
  const std::vector<uint64_t> other = {1, 2, 3, 5};
  EXPECT_EQ(SeededHash(values, 5), SeededHash(same, 5));
  EXPECT_NE(SeededHash(values, 5), SeededHash(other, 5));
}

TEST(HashTest, MixMatchesSplitMix64) {
  EXPECT_EQ(Mix(0), 0xE220A8397B1DCDAFULL);
  EXPECT_NE(Mix(1), Mix(2));
  EXPECT_EQ(DeriveSeed(3, 100), Mix(103));
}

TEST(HashTest, SeededHasherMatchesSeededHash) {
  detail::SeededHasher<uint64_t, 77> hasher;
  EXPECT_EQ(hasher(uint64_t{5}), static_cast<size_t>(SeededHash(uint64_t{5}, 77)));
}

TEST(SaturatingTest, UnsignedAddClampsAtMax) {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(SaturatingAdd<uint64_t>(1, 2), 3u);
  EXPECT_EQ(SaturatingAdd<uint64_t>(kMax, 1), kMax);
  EXPECT_EQ(SaturatingAdd<uint64_t>(kMax - 1, kMax), kMax);
}

TEST(SaturatingTest, UnsignedSubClampsAtZero) {
  EXPECT_EQ(SaturatingSub<uint64_t>(5, 3), 2u);
  EXPECT_EQ(SaturatingSub<uint64_t>(3, 5), 0u);
}

TEST(SaturatingTest, SignedOperationsClampAtBothBounds) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  EXPECT_EQ(SaturatingAdd<int64_t>(kMax, 1), kMax);
  EXPECT_EQ(SaturatingAdd<int64_t>(kMin, -1), kMin);
  EXPECT_EQ(SaturatingSub<int64_t>(kMin, 1), kMin);
  EXPECT_EQ(SaturatingSub<int64_t>(kMax, -1), kMax);
  EXPECT_EQ(SaturatingAdd<int64_t>(-4, 10), 6);
  EXPECT_EQ(SaturatingNeg<int64_t>(kMin), kMax);
  EXPECT_EQ(SaturatingNeg<int64_t>(-7), 7);
}

}  // namespace
}  // namespace sketches
