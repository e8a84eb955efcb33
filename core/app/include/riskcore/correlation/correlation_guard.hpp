#pragma once

#include "riskcore/correlation/correlation_matrix.hpp"
#include "riskcore/domain/return_series.hpp"
#include "riskcore/domain/risk_limits.hpp"
#include "riskcore/time/time_utils.hpp"

#include <string>
#include <vector>

namespace riskcore {

// Verdict of CorrelationGuard::check_new_trade().
struct CorrelationCheck {
  bool approved{true};
  std::string reason{"approved"};
};

// -----------------------------------------------------------------------------
// CorrelationGuard — blocks trades that would concentrate correlated risk
// -----------------------------------------------------------------------------
//
// @brief  Computes pairwise return correlations and answers two questions:
//         would a new ticker create an over-correlated pair or cluster, and
//         how correlated is a given set of holdings overall.
//
// @details
// Correlation model:
//   Plain Pearson correlation on raw return arrays (no de-meaning per
//   window, no autocorrelation correction). Two series of different length
//   are compared over their common most-recent window of
//   min(len(a), len(b)) observations. If that window is shorter than
//   config.min_data_points, or either side has zero variance, the pair is
//   reported as 0.0 ("no evidence of correlation").
//
// Clustering (greedy, single pass, lexicographic ticker order):
//   for each ticker not yet assigned:
//     start a cluster with it;
//     absorb every later unassigned ticker with |corr| >= cluster_threshold
//       against the seed;
//   keep clusters of size >= 2.
//   Membership is decided against the seed only, so the result is
//   order-dependent by construction and fully deterministic.
//
// No caching: every compute_matrix() call is a fresh O(n²·L) pass.
//
// Thread model:
//   Holds only its immutable config. All methods are const and safe to call
//   concurrently from any thread.
// -----------------------------------------------------------------------------
class CorrelationGuard {
 public:
  // @throws std::invalid_argument if the config violates its invariants.
  explicit CorrelationGuard(domain::CorrelationConfig config = {});

  // -------------------------------------------------------------------------
  // compute_matrix(returns, computed_at)
  // -------------------------------------------------------------------------
  // @brief  Builds a CorrelationMatrix over every ticker in `returns`.
  //
  // @param  returns      Return series per ticker; lengths may differ.
  // @param  computed_at  Timestamp recorded on the matrix.
  //
  // @return The matrix; empty for empty input. Never throws on degenerate
  //         input (short, constant or empty series).
  // -------------------------------------------------------------------------
  CorrelationMatrix compute_matrix(
      const domain::ReturnSeriesMap& returns,
      Timestamp computed_at = std::chrono::system_clock::now()) const;

  // -------------------------------------------------------------------------
  // check_new_trade(ticker, matrix, current_holdings)
  // -------------------------------------------------------------------------
  // @brief  Decides whether adding `ticker` keeps correlation risk in limits.
  //
  // @details
  // Approves trivially when current_holdings is empty or the ticker is not
  // in the matrix. Otherwise, in order:
  //   1. Pairwise: the first holding (in holdings order) whose
  //      |corr| with ticker is > max_pairwise_correlation rejects.
  //      Holdings absent from the matrix are not compared. A holding equal
  //      to the ticker has |corr| 1.0, so adding to a held name is rejected.
  //   2. Cluster: for every matrix cluster containing ticker, count the
  //      entries of current_holdings already in it; reject if
  //      that count >= max_cluster_size - 1. Clusters are the snapshot
  //      clusters of `matrix`; they are not recomputed with the candidate
  //      counted as held.
  // -------------------------------------------------------------------------
  CorrelationCheck check_new_trade(
      const std::string& ticker, const CorrelationMatrix& matrix,
      const std::vector<std::string>& current_holdings) const;

  // -------------------------------------------------------------------------
  // get_portfolio_concentration_score(matrix, holdings)
  // -------------------------------------------------------------------------
  // @return 0.0 for fewer than two holdings. Otherwise the mean |corr| over
  //         all unordered holding pairs that are present in the matrix
  //         (absent pairs are skipped, not counted as zero), scaled to
  //         [0, 100].
  // -------------------------------------------------------------------------
  double get_portfolio_concentration_score(
      const CorrelationMatrix& matrix,
      const std::vector<std::string>& holdings) const;

  // -------------------------------------------------------------------------
  // pearson(a, b)
  // -------------------------------------------------------------------------
  // @brief  Correlation of the common most-recent window of a and b, under
  //         the min_data_points and zero-variance rules above. Result is
  //         clamped to [-1, 1].
  // -------------------------------------------------------------------------
  double pearson(const domain::ReturnSeries& a,
                 const domain::ReturnSeries& b) const;

  const domain::CorrelationConfig& config() const { return config_; }

 private:
  const domain::CorrelationConfig config_;
};

}  // namespace riskcore
