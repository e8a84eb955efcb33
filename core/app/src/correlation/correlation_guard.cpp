#include "riskcore/correlation/correlation_guard.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace riskcore {

namespace {

// Sum of squared deviations below this is treated as a constant series.
// Return series live around 1e-2, so any real dispersion is far above it;
// what falls below is rounding noise from computing the mean.
constexpr double kMinSumSquares = 1e-20;

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: validate and store config
// -----------------------------------------------------------------------------
CorrelationGuard::CorrelationGuard(domain::CorrelationConfig config)
    : config_(std::move(config)) {
  domain::validate(config_);
}

// -----------------------------------------------------------------------------
// pearson(): sample correlation over the common most-recent window
// -----------------------------------------------------------------------------
double CorrelationGuard::pearson(const domain::ReturnSeries& a,
                                 const domain::ReturnSeries& b) const {
  const std::size_t n = std::min(a.size(), b.size());
  if (n < 2 || n < static_cast<std::size_t>(config_.min_data_points)) {
    return 0.0;
  }

  // Align on the tail: both histories end at the same (latest) day.
  const std::size_t off_a = a.size() - n;
  const std::size_t off_b = b.size() - n;

  double mean_a = 0.0;
  double mean_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    mean_a += a[off_a + i];
    mean_b += b[off_b + i];
  }
  mean_a /= static_cast<double>(n);
  mean_b /= static_cast<double>(n);

  double cov = 0.0;
  double ss_a = 0.0;
  double ss_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double da = a[off_a + i] - mean_a;
    const double db = b[off_b + i] - mean_b;
    cov += da * db;
    ss_a += da * da;
    ss_b += db * db;
  }

  if (ss_a < kMinSumSquares || ss_b < kMinSumSquares) {
    return 0.0;
  }

  const double corr = cov / std::sqrt(ss_a * ss_b);
  return std::clamp(corr, -1.0, 1.0);
}

// -----------------------------------------------------------------------------
// compute_matrix(): fresh O(n²) pass, greedy clustering, extreme pair
// -----------------------------------------------------------------------------
CorrelationMatrix CorrelationGuard::compute_matrix(
    const domain::ReturnSeriesMap& returns, Timestamp computed_at) const {
  if (returns.empty()) {
    return CorrelationMatrix({}, {}, {}, 0.0, computed_at);
  }

  // std::map iteration order is lexicographic: this fixes the row order,
  // the clustering order and the max-pair tie-break.
  std::vector<std::string> tickers;
  std::vector<const domain::ReturnSeries*> series;
  tickers.reserve(returns.size());
  series.reserve(returns.size());
  for (const auto& [ticker, rets] : returns) {
    tickers.push_back(ticker);
    series.push_back(&rets);
  }

  const std::size_t n = tickers.size();
  std::vector<double> values(n * n, 0.0);

  double max_corr = 0.0;
  double max_abs = -1.0;

  for (std::size_t i = 0; i < n; ++i) {
    values[i * n + i] = 1.0;
    for (std::size_t j = i + 1; j < n; ++j) {
      const double corr = pearson(*series[i], *series[j]);
      values[i * n + j] = corr;
      values[j * n + i] = corr;

      // Strictly greater: ties keep the first pair seen.
      if (std::abs(corr) > max_abs) {
        max_abs = std::abs(corr);
        max_corr = corr;
      }
    }
  }

  std::vector<CorrelationMatrix::Cluster> clusters;
  std::vector<bool> assigned(n, false);
  for (std::size_t i = 0; i < n; ++i) {
    if (assigned[i]) {
      continue;
    }
    assigned[i] = true;

    CorrelationMatrix::Cluster cluster{tickers[i]};
    for (std::size_t j = i + 1; j < n; ++j) {
      if (assigned[j]) {
        continue;
      }
      if (std::abs(values[i * n + j]) >= config_.cluster_threshold) {
        cluster.push_back(tickers[j]);
        assigned[j] = true;
      }
    }

    if (cluster.size() >= 2) {
      clusters.push_back(std::move(cluster));
    }
  }

  return CorrelationMatrix(std::move(tickers), std::move(values),
                           std::move(clusters), max_corr, computed_at);
}

// -----------------------------------------------------------------------------
// check_new_trade(): pairwise limit first, then cluster size limit
// -----------------------------------------------------------------------------
CorrelationCheck CorrelationGuard::check_new_trade(
    const std::string& ticker, const CorrelationMatrix& matrix,
    const std::vector<std::string>& current_holdings) const {
  if (current_holdings.empty() || !matrix.contains(ticker)) {
    return CorrelationCheck{};
  }

  // --- Pairwise limit -------------------------------------------------------
  for (const auto& holding : current_holdings) {
    auto corr = matrix.get_correlation(ticker, holding);
    if (!corr.has_value()) {
      continue;
    }
    if (std::abs(*corr) > config_.max_pairwise_correlation) {
      std::ostringstream reason;
      reason << std::fixed << std::setprecision(2) << ticker
             << " correlation with " << holding << " is " << *corr
             << ", exceeds limit " << config_.max_pairwise_correlation;
      return CorrelationCheck{false, reason.str()};
    }
  }

  // --- Cluster size limit ---------------------------------------------------
  for (const auto& cluster : matrix.clusters()) {
    if (std::find(cluster.begin(), cluster.end(), ticker) == cluster.end()) {
      continue;
    }

    int overlap = 0;
    for (const auto& holding : current_holdings) {
      if (std::find(cluster.begin(), cluster.end(), holding) != cluster.end()) {
        ++overlap;
      }
    }

    if (overlap >= config_.max_cluster_size - 1) {
      std::ostringstream reason;
      reason << ticker << " would join a correlated cluster already holding "
             << overlap << " position(s) (cluster limit "
             << config_.max_cluster_size << ")";
      return CorrelationCheck{false, reason.str()};
    }
  }

  return CorrelationCheck{};
}

// -----------------------------------------------------------------------------
// get_portfolio_concentration_score(): mean |corr| of known pairs, 0–100
// -----------------------------------------------------------------------------
double CorrelationGuard::get_portfolio_concentration_score(
    const CorrelationMatrix& matrix,
    const std::vector<std::string>& holdings) const {
  if (holdings.size() < 2) {
    return 0.0;
  }

  double total = 0.0;
  std::size_t pairs = 0;
  for (std::size_t i = 0; i < holdings.size(); ++i) {
    for (std::size_t j = i + 1; j < holdings.size(); ++j) {
      auto corr = matrix.get_correlation(holdings[i], holdings[j]);
      if (!corr.has_value()) {
        continue;
      }
      total += std::abs(*corr);
      ++pairs;
    }
  }

  if (pairs == 0) {
    return 0.0;
  }
  return std::min(100.0, total / static_cast<double>(pairs) * 100.0);
}

}  // namespace riskcore
