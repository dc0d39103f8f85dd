#include <cstdint>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "minhash/lsh_index.hpp"

namespace sketches {
namespace {

using Index = MinHashLshIndex<uint64_t, uint64_t>;

MinHash<uint64_t> SignatureOfRange(uint64_t begin, uint64_t end,
                                   size_t num_hashes) {
  MinHash<uint64_t> signature(num_hashes);
  for (uint64_t value = begin; value < end; ++value) signature.Add(value);
  return signature;
}

bool ContainsId(const std::vector<uint64_t>& ids, uint64_t id) {
  for (const uint64_t candidate : ids) {
    if (candidate == id) return true;
  }
  return false;
}

TEST(MinHashLshIndexTest, ConstructorValidatesParameters) {
  EXPECT_THROW(Index(0, 8), InvalidParameter);
  EXPECT_THROW(Index(64, 0), InvalidParameter);
  EXPECT_THROW(Index(63, 8), InvalidParameter);
  const Index index(96, 12);
  EXPECT_EQ(index.num_hashes(), 96u);
  EXPECT_EQ(index.bands(), 12u);
  EXPECT_EQ(index.rows_per_band(), 8u);
  EXPECT_TRUE(index.empty());
}

TEST(MinHashLshIndexTest, RejectsIncompatibleSignatures) {
  Index index(64, 8);
  const auto signature = SignatureOfRange(0, 1000, 32);
  EXPECT_THROW(index.Insert(1, signature), IncompatibleSketches);
  EXPECT_THROW(index.QueryCandidates(signature), IncompatibleSketches);
  EXPECT_THROW(index.QueryTopK(signature, 5), IncompatibleSketches);
}

TEST(MinHashLshIndexTest, InsertRemoveAndContains) {
  Index index(64, 8);
  const auto signature = SignatureOfRange(0, 1000, 64);
  index.Insert(10, signature);
  EXPECT_TRUE(index.Contains(10));
  EXPECT_EQ(index.size(), 1u);

  EXPECT_TRUE(index.Remove(10));
  EXPECT_FALSE(index.Remove(10));
  EXPECT_TRUE(index.empty());
  EXPECT_TRUE(index.QueryCandidates(signature).empty());
}

TEST(MinHashLshIndexTest, InsertReplacesSignature) {
  Index index(128, 32);
  const auto first = SignatureOfRange(0, 10000, 128);
  const auto second = SignatureOfRange(20000, 30000, 128);
  index.Insert(7, first);
  index.Insert(7, second);

  EXPECT_EQ(index.size(), 1u);
  EXPECT_TRUE(index.QueryCandidates(first).empty());
  const auto top = index.QueryTopK(second, 1);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].first, 7u);
  EXPECT_GT(top[0].second, 0.9);
}

TEST(MinHashLshIndexTest, SimilarItemsAreCandidates) {
  Index index(128, 32);
  index.Insert(1, SignatureOfRange(0, 10000, 128));
  index.Insert(2, SignatureOfRange(500, 10500, 128));
  index.Insert(3, SignatureOfRange(100000, 110000, 128));

  const auto query = SignatureOfRange(0, 10000, 128);
  const auto candidates = index.QueryCandidates(query);
  EXPECT_TRUE(ContainsId(candidates, 1));
  EXPECT_TRUE(ContainsId(candidates, 2));
  EXPECT_FALSE(ContainsId(candidates, 3));
}

TEST(MinHashLshIndexTest, TopKIsSortedBySimilarity) {
  Index index(128, 32);
  index.Insert(1, SignatureOfRange(0, 10000, 128));
  index.Insert(2, SignatureOfRange(1000, 11000, 128));
  index.Insert(3, SignatureOfRange(3000, 13000, 128));

  const auto query = SignatureOfRange(0, 10000, 128);
  EXPECT_TRUE(index.QueryTopK(query, 0).empty());

  const auto top = index.QueryTopK(query, 3);
  ASSERT_FALSE(top.empty());
  EXPECT_EQ(top[0].first, 1u);
  for (size_t i = 1; i < top.size(); ++i) {
    EXPECT_GE(top[i - 1].second, top[i].second);
  }
  EXPECT_LE(index.QueryTopK(query, 2).size(), 2u);
}

TEST(MinHashLshIndexTest, TiesAreOrderedById) {
  Index index(64, 16);
  const auto signature = SignatureOfRange(0, 100, 64);
  for (const uint64_t id : {42u, 7u, 19u}) index.Insert(id, signature);

  const auto top = index.QueryTopK(signature, 3);
  ASSERT_EQ(top.size(), 3u);
  EXPECT_EQ(top[0].first, 7u);
  EXPECT_EQ(top[1].first, 19u);
  EXPECT_EQ(top[2].first, 42u);
}

TEST(MinHashLshIndexTest, StringIds) {
  MinHashLshIndex<std::string, std::string> index(32, 8);
  MinHash<std::string> doc(32);
  for (const char* word : {"the", "quick", "brown", "fox"}) doc.Add(word);
  index.Insert("doc-1", doc);
  const auto top = index.QueryTopK(doc, 1);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].first, "doc-1");
}

TEST(MinHashLshIndexTest, ClearResetsState) {
  Index index(64, 8);
  const auto signature = SignatureOfRange(0, 1000, 64);
  index.Insert(1, signature);
  index.Clear();
  EXPECT_TRUE(index.empty());
  EXPECT_TRUE(index.QueryCandidates(signature).empty());
}

}  // namespace
}  // namespace sketches
