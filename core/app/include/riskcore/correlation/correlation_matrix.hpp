#pragma once

#include "riskcore/time/time_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace riskcore {

// -----------------------------------------------------------------------------
// CorrelationMatrix — immutable pairwise correlation snapshot
// -----------------------------------------------------------------------------
//
// @brief  Symmetric N×N matrix of Pearson correlations for an ordered set of
//         tickers, plus the clusters and the extreme pair found in it.
//
// @details
// Built by CorrelationGuard::compute_matrix() (or directly, in tests) from a
// snapshot of return series and never mutated afterwards.
//
// Storage:
//   values_ is a packed row-major N×N array. index_ maps ticker → row so a
//   pair lookup is O(1) instead of a linear search of tickers_. Both are
//   built once in the constructor.
//
// Diagonal entries are 1.0 by definition. Clusters are lists of ≥2 tickers
// whose pairwise |corr| reached the guard's cluster_threshold.
//
// Thread model:
//   Value type, read-only after construction; safe to share between threads.
// -----------------------------------------------------------------------------
class CorrelationMatrix {
 public:
  using Cluster = std::vector<std::string>;

  // Empty matrix (no tickers).
  CorrelationMatrix() = default;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  tickers          Row/column order. Must not contain duplicates.
  // @param  values           Row-major N×N values (size tickers.size()²).
  // @param  clusters         Correlated groups, each of size >= 2.
  // @param  max_correlation  Signed value of the largest-|corr| pair.
  // @param  computed_at      When the snapshot was taken.
  //
  // @throws std::invalid_argument if values.size() != N*N.
  // -------------------------------------------------------------------------
  CorrelationMatrix(std::vector<std::string> tickers,
                    std::vector<double> values,
                    std::vector<Cluster> clusters,
                    double max_correlation,
                    Timestamp computed_at);

  // -------------------------------------------------------------------------
  // get_correlation(a, b)
  // -------------------------------------------------------------------------
  // @return The stored correlation, or std::nullopt if either ticker is not
  //         part of the matrix. get_correlation(a, a) is 1.0 for any
  //         ticker in the matrix.
  // -------------------------------------------------------------------------
  std::optional<double> get_correlation(const std::string& a,
                                        const std::string& b) const;

  bool contains(const std::string& ticker) const;

  // Value at (row, col); both must be < size().
  double at(std::size_t row, std::size_t col) const {
    return values_[row * tickers_.size() + col];
  }

  std::size_t size() const { return tickers_.size(); }
  bool empty() const { return tickers_.empty(); }

  const std::vector<std::string>& tickers() const { return tickers_; }
  const std::vector<Cluster>& clusters() const { return clusters_; }
  double max_correlation() const { return max_correlation_; }
  Timestamp computed_at() const { return computed_at_; }

  // Row-major rows, for serialisation.
  std::vector<std::vector<double>> rows() const;

 private:
  std::vector<std::string> tickers_;
  std::vector<double> values_;
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<Cluster> clusters_;
  double max_correlation_{0.0};
  Timestamp computed_at_{};
};

}  // namespace riskcore
