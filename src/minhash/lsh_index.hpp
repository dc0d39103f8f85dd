#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "error.hpp"
#include "hash.hpp"
#include "minhash.hpp"

namespace sketches {

namespace lsh_constants {
inline constexpr uint64_t kBandSeedBase = 0xA0761D6478BD642FULL;
}  // namespace lsh_constants

/// Banded locality sensitive hashing index over MinHash signatures.
///
/// Leskovec, Jure, Anand Rajaraman, and Jeffrey David Ullman. Mining of
/// massive datasets, chapter 3.4. Cambridge University Press, 2020.
///
/// A signature of num_hashes positions is split into bands of rows_per_band
/// positions. Ids whose signatures agree on all rows of at least one band
/// share a bucket and are returned as candidates.
///
/// @tparam Id identifier of indexed entries.
/// @tparam T the data type summarized by the MinHash signatures.
template <typename Id, typename T>
class MinHashLshIndex {
 public:
  using Signature = MinHash<T>;

  MinHashLshIndex(size_t num_hashes, size_t bands)
      : num_hashes_(num_hashes), bands_(bands) {
    if (num_hashes == 0) {
      throw InvalidParameter("num_hashes must be greater than zero");
    }
    if (bands == 0) {
      throw InvalidParameter("bands must be greater than zero");
    }
    if (num_hashes % bands != 0) {
      throw InvalidParameter("num_hashes must be divisible by bands");
    }
    rows_per_band_ = num_hashes / bands;
    seeds_ = Signature::MakeSeeds(num_hashes);
    band_seeds_.reserve(bands);
    for (size_t band = 0; band < bands; ++band) {
      band_seeds_.push_back(DeriveSeed(band, lsh_constants::kBandSeedBase));
    }
    tables_.resize(bands);
  }

  /// Indexes signature under id, replacing any signature stored for id.
  void Insert(const Id& id, const Signature& signature) {
    CheckCompatible(signature);
    Remove(id);
    for (size_t band = 0; band < bands_; ++band) {
      tables_[band][BandHash(signature, band)].insert(id);
    }
    signatures_.emplace(id, signature);
  }

  /// @return true if id was indexed.
  bool Remove(const Id& id) {
    auto it = signatures_.find(id);
    if (it == signatures_.end()) return false;

    for (size_t band = 0; band < bands_; ++band) {
      auto& table = tables_[band];
      auto bucket = table.find(BandHash(it->second, band));
      if (bucket == table.end()) continue;
      bucket->second.erase(id);
      if (bucket->second.empty()) table.erase(bucket);
    }
    signatures_.erase(it);
    return true;
  }

  /// Ids sharing at least one band bucket with query, in no particular order.
  std::vector<Id> QueryCandidates(const Signature& query) const {
    CheckCompatible(query);
    std::unordered_set<Id, detail::SeededHasher<Id>> candidates;
    for (size_t band = 0; band < bands_; ++band) {
      const auto& table = tables_[band];
      if (auto bucket = table.find(BandHash(query, band));
          bucket != table.end()) {
        candidates.insert(bucket->second.begin(), bucket->second.end());
      }
    }
    return std::vector<Id>(candidates.begin(), candidates.end());
  }

  /// Up to k candidates with their estimated similarity to query, most
  /// similar first. Equal similarities are ordered by ascending id when ids
  /// are ordered.
  std::vector<std::pair<Id, double>> QueryTopK(const Signature& query,
                                               size_t k) const {
    CheckCompatible(query);
    std::vector<std::pair<Id, double>> scored;
    if (k == 0) return scored;

    for (auto& id : QueryCandidates(query)) {
      const double similarity = signatures_.at(id).EstimateJaccard(query);
      scored.emplace_back(std::move(id), similarity);
    }
    std::sort(scored.begin(), scored.end(),
              [](const auto& a, const auto& b) {
                if (a.second != b.second) return a.second > b.second;
                if constexpr (std::totally_ordered<Id>) {
                  return a.first < b.first;
                } else {
                  return false;
                }
              });
    if (scored.size() > k) scored.resize(k);
    return scored;
  }

  bool Contains(const Id& id) const { return signatures_.contains(id); }

  void Clear() {
    signatures_.clear();
    for (auto& table : tables_) table.clear();
  }

  size_t num_hashes() const { return num_hashes_; }
  size_t bands() const { return bands_; }
  size_t rows_per_band() const { return rows_per_band_; }
  /// Number of indexed ids.
  size_t size() const { return signatures_.size(); }
  bool empty() const { return signatures_.empty(); }

 private:
  using Bucket = std::unordered_set<Id, detail::SeededHasher<Id>>;

  size_t num_hashes_;
  size_t bands_;
  size_t rows_per_band_;
  std::vector<uint64_t> seeds_;
  std::vector<uint64_t> band_seeds_;
  std::vector<std::unordered_map<uint64_t, Bucket>> tables_;
  std::unordered_map<Id, Signature, detail::SeededHasher<Id>> signatures_;

  void CheckCompatible(const Signature& signature) const {
    if (signature.num_hashes() != num_hashes_ ||
        signature.seeds() != seeds_) {
      throw IncompatibleSketches(
          "signature num_hashes must match index num_hashes: " +
          std::to_string(signature.num_hashes()) + " vs " +
          std::to_string(num_hashes_));
    }
  }

  uint64_t BandHash(const Signature& signature, size_t band) const {
    const std::span<const uint64_t> rows =
        signature.signature().subspan(band * rows_per_band_, rows_per_band_);
    return SeededHash(rows, band_seeds_[band]);
  }
};

}  // namespace sketches
