#include "riskcore/var/var_position_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace riskcore {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
VaRPositionSizer::VaRPositionSizer(domain::VaRConfig config, double equity)
    : config_(std::move(config)), equity_(std::max(0.0, equity)) {
  domain::validate(config_);
}

// -----------------------------------------------------------------------------
// equity accessors (guarded)
// -----------------------------------------------------------------------------
double VaRPositionSizer::equity() const {
  std::lock_guard<std::mutex> lock(equity_mutex_);
  return equity_;
}

void VaRPositionSizer::set_equity(double value) {
  std::lock_guard<std::mutex> lock(equity_mutex_);
  equity_ = std::max(0.0, value);
}

double VaRPositionSizer::risk_metric(const VaRResult& result) const {
  return config_.use_cvar ? result.cvar_pct : result.var_pct;
}

// -----------------------------------------------------------------------------
// compute_var()
// -----------------------------------------------------------------------------
VaRResult VaRPositionSizer::compute_var(
    const domain::ReturnSeries& returns) const {
  return compute_var(returns, equity());
}

VaRResult VaRPositionSizer::compute_var(const domain::ReturnSeries& returns,
                                        double equity) const {
  VaRResult result;
  result.confidence_level = config_.confidence_level;
  result.data_points = returns.size();

  const std::size_t n = returns.size();
  if (n < kMinObservations) {
    return result;
  }

  domain::ReturnSeries sorted(returns);
  std::sort(sorted.begin(), sorted.end());

  // floor(n * (1 - c)), clamped into the array.
  const double raw_index =
      std::floor(static_cast<double>(n) * (1.0 - config_.confidence_level));
  const std::size_t index = static_cast<std::size_t>(
      std::clamp(raw_index, 0.0, static_cast<double>(n - 1)));

  result.var_pct = std::abs(sorted[index]) * 100.0;

  double tail_sum = 0.0;
  for (std::size_t i = 0; i <= index; ++i) {
    tail_sum += std::abs(sorted[i]);
  }
  result.cvar_pct = tail_sum / static_cast<double>(index + 1) * 100.0;

  const double metric = risk_metric(result);
  result.risk_budget_remaining =
      std::max(0.0, config_.max_portfolio_var_pct - metric);
  result.max_position_size =
      result.risk_budget_remaining / 100.0 * std::max(0.0, equity);

  return result;
}

// -----------------------------------------------------------------------------
// size_position()
// -----------------------------------------------------------------------------
double VaRPositionSizer::size_position(
    const domain::ReturnSeries& ticker_returns, double current_price,
    double existing_var_pct) const {
  return size_position(ticker_returns, current_price, existing_var_pct,
                       equity());
}

double VaRPositionSizer::size_position(
    const domain::ReturnSeries& ticker_returns, double current_price,
    double existing_var_pct, double equity) const {
  if (current_price <= 0.0 || equity <= 0.0) {
    return 0.0;
  }

  // Budget first: an exhausted portfolio budget yields 0 even when the
  // candidate has too little history for its own estimate.
  const double available =
      std::min(config_.max_portfolio_var_pct - existing_var_pct,
               config_.max_position_var_pct);
  if (available <= 0.0) {
    return 0.0;
  }

  const double flat = config_.max_position_var_pct / 100.0 * equity;

  const double metric = risk_metric(compute_var(ticker_returns, equity));
  if (metric <= 0.0) {
    return flat;
  }

  return std::min(equity * (available / metric), flat);
}

// -----------------------------------------------------------------------------
// compute_portfolio_var(): weighted synthetic series → compute_var
// -----------------------------------------------------------------------------
VaRResult VaRPositionSizer::compute_portfolio_var(
    const domain::ReturnSeriesMap& positions_returns,
    const std::map<std::string, double>& weights) const {
  return compute_portfolio_var(positions_returns, weights, equity());
}

VaRResult VaRPositionSizer::compute_portfolio_var(
    const domain::ReturnSeriesMap& positions_returns,
    const std::map<std::string, double>& weights, double equity) const {
  if (positions_returns.empty()) {
    VaRResult empty;
    empty.confidence_level = config_.confidence_level;
    return empty;
  }

  std::size_t common = std::numeric_limits<std::size_t>::max();
  for (const auto& [ticker, rets] : positions_returns) {
    common = std::min(common, rets.size());
  }

  domain::ReturnSeries synthetic(common, 0.0);
  for (const auto& [ticker, rets] : positions_returns) {
    auto w = weights.find(ticker);
    if (w == weights.end()) {
      continue;
    }
    const std::size_t offset = rets.size() - common;
    for (std::size_t k = 0; k < common; ++k) {
      synthetic[k] += w->second * rets[offset + k];
    }
  }

  return compute_var(synthetic, equity);
}

}  // namespace riskcore
