#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "error.hpp"

namespace sketches {

namespace tdigest_constants {
/// smallest accepted compression
inline constexpr double kMinCompression = 10.0;
/// compress once there are more than this many centroids per unit compression
inline constexpr double kCentroidLimitFactor = 8.0;
}  // namespace tdigest_constants

/// t-Digest for quantile estimation over doubles.
///
/// Dunning, Ted, and Otmar Ertl. "Computing extremely accurate quantiles using
/// t-digests." arXiv preprint arXiv:1902.04023 (2019).
///
/// Centroids are kept sorted by mean. A centroid at normalized rank q holds at
/// most max(4 * total_weight / compression * q * (1 - q), 1) weight, which
/// keeps the tails fine grained.
class TDigest {
 public:
  struct Centroid {
    double mean;
    double weight;
  };

  explicit TDigest(double compression) : compression_(compression) {
    if (!std::isfinite(compression) ||
        compression < tdigest_constants::kMinCompression) {
      throw InvalidParameter(
          "compression must be finite and greater than or equal to 10");
    }
  }

  /// Creates a digest with compression = ceil(10 / quantile_error).
  static TDigest ForQuantileError(double quantile_error) {
    detail::check_open_unit(quantile_error, "quantile_error");
    return TDigest(std::max(tdigest_constants::kMinCompression,
                            std::ceil(10.0 / quantile_error)));
  }

  void Add(double value) { AddWeighted(value, 1.0); }

  /// Adds a value with the given weight. Non-finite values and weights that
  /// are not finite and positive are ignored.
  void AddWeighted(double value, double weight) {
    if (!std::isfinite(value) || !std::isfinite(weight) || weight <= 0.0) {
      return;
    }

    if (centroids_.empty()) {
      centroids_.push_back({value, weight});
      total_weight_ += weight;
      return;
    }

    const size_t nearest = NearestCentroid(value);
    auto& centroid = centroids_[nearest];
    const double max_weight = MaxCentroidWeight(CentroidQuantile(nearest));
    if (centroid.weight + weight <= max_weight) {
      // no other centroid lies between the nearest mean and value, so moving
      // the mean keeps the list sorted
      const double updated_weight = centroid.weight + weight;
      centroid.mean += (value - centroid.mean) * (weight / updated_weight);
      centroid.weight = updated_weight;
    } else {
      const auto pos = std::upper_bound(
          centroids_.begin(), centroids_.end(), value,
          [](double v, const Centroid& c) { return v < c.mean; });
      centroids_.insert(pos, {value, weight});
    }

    total_weight_ += weight;
    if (static_cast<double>(centroids_.size()) >
        compression_ * tdigest_constants::kCentroidLimitFactor) {
      Compress();
    }
  }

  /// Approximate value at normalized rank q in [0, 1], interpolated between
  /// the two centroids straddling q * total_weight.
  double Quantile(double q) const {
    if (!(q >= 0.0 && q <= 1.0)) {
      throw InvalidParameter("q must be finite and in [0, 1]");
    }
    if (centroids_.empty()) {
      throw InvalidParameter("quantile is undefined for an empty digest");
    }

    if (q <= 0.0) return centroids_.front().mean;
    if (q >= 1.0) return centroids_.back().mean;

    const double target = q * total_weight_;
    double cumulative = 0.0;
    for (size_t i = 0; i < centroids_.size(); ++i) {
      const auto& current = centroids_[i];
      const double next_cumulative = cumulative + current.weight;
      if (target <= next_cumulative) {
        if (i == 0) return current.mean;

        const auto& previous = centroids_[i - 1];
        const double left_rank = cumulative - previous.weight * 0.5;
        const double right_rank = cumulative + current.weight * 0.5;
        if (right_rank <= left_rank + std::numeric_limits<double>::epsilon()) {
          return current.mean;
        }
        const double t = std::clamp(
            (target - left_rank) / (right_rank - left_rank), 0.0, 1.0);
        return previous.mean + t * (current.mean - previous.mean);
      }
      cumulative = next_cumulative;
    }
    return centroids_.back().mean;
  }

  /// Adds every centroid of other, then compresses.
  void Merge(const TDigest& other) {
    if (std::abs(compression_ - other.compression_) >
        std::numeric_limits<double>::epsilon()) {
      throw IncompatibleSketches("compression must match for merge: " +
                                 std::to_string(compression_) + " vs " +
                                 std::to_string(other.compression_));
    }
    const std::vector<Centroid> incoming = other.centroids_;
    for (const auto& c : incoming) AddWeighted(c.mean, c.weight);
    Compress();
  }

  /// Greedily merges adjacent centroids while they stay under the weight cap.
  void Compress() {
    if (centroids_.size() <= 1) return;

    std::vector<Centroid> merged;
    merged.reserve(centroids_.size());
    double cumulative = 0.0;
    for (const auto& centroid : centroids_) {
      if (!merged.empty()) {
        auto& last = merged.back();
        const double q = std::clamp(
            (cumulative + 0.5 * last.weight) / std::max(total_weight_, 1.0),
            0.0, 1.0);
        if (last.weight + centroid.weight <= MaxCentroidWeight(q)) {
          const double updated_weight = last.weight + centroid.weight;
          last.mean +=
              (centroid.mean - last.mean) * (centroid.weight / updated_weight);
          last.weight = updated_weight;
          continue;
        }
        cumulative += last.weight;
      }
      merged.push_back(centroid);
    }
    centroids_.swap(merged);
  }

  void Clear() {
    centroids_.clear();
    total_weight_ = 0.0;
  }

  double compression() const { return compression_; }
  size_t centroid_count() const { return centroids_.size(); }
  const std::vector<Centroid>& centroids() const { return centroids_; }
  double total_weight() const { return total_weight_; }
  /// Total weight rounded to an integer.
  uint64_t count() const {
    return static_cast<uint64_t>(std::llround(total_weight_));
  }
  bool is_empty() const { return total_weight_ == 0.0; }

 private:
  double compression_;
  std::vector<Centroid> centroids_;
  double total_weight_ = 0.0;

  /// Index of the centroid with the closest mean, the lower one on ties.
  size_t NearestCentroid(double value) const {
    const auto it = std::lower_bound(
        centroids_.begin(), centroids_.end(), value,
        [](const Centroid& c, double v) { return c.mean < v; });
    const auto i = static_cast<size_t>(it - centroids_.begin());
    if (i == 0) return 0;
    if (i == centroids_.size()) return i - 1;
    const double below = value - centroids_[i - 1].mean;
    const double above = centroids_[i].mean - value;
    return below <= above ? i - 1 : i;
  }

  double CentroidQuantile(size_t index) const {
    double before = 0.0;
    for (size_t i = 0; i < index; ++i) before += centroids_[i].weight;
    const double centered = before + centroids_[index].weight * 0.5;
    return std::clamp(centered / std::max(total_weight_, 1.0), 0.0, 1.0);
  }

  double MaxCentroidWeight(double q) const {
    return std::max(4.0 * total_weight_ / compression_ * q * (1.0 - q), 1.0);
  }
};

}  // namespace sketches
