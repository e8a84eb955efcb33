#pragma once

#include "riskcore/domain/return_series.hpp"
#include "riskcore/domain/risk_limits.hpp"
#include "riskcore/var/var_result.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace riskcore {

// -----------------------------------------------------------------------------
// VaRPositionSizer — turns a VaR budget into a maximum position size
// -----------------------------------------------------------------------------
//
// @brief  Historical VaR / CVaR estimation and risk-budget position sizing.
//
// @details
// Historical estimator (no distributional assumption):
//   sorted   = returns sorted ascending
//   index    = floor(n * (1 - confidence_level)), clamped to [0, n-1]
//   var_pct  = |sorted[index]| * 100
//   cvar_pct = mean(|sorted[0..index]|) * 100     (inclusive tail)
//
// The driving risk metric is cvar_pct when config.use_cvar, else var_pct.
//
// Sizing (size_position):
//   flat      = max_position_var_pct / 100 * equity
//   available = min(max_portfolio_var_pct - existing_var_pct,
//                   max_position_var_pct)
//   available <= 0           → 0.0 (budget exhausted)
//   metric <= 0 (no data)    → flat
//   otherwise                → min(equity * available / metric, flat)
// The result never increases when either the ticker's own risk or the
// already-consumed portfolio risk increases.
//
// Portfolio VaR (compute_portfolio_var) is a weighted sum of the return
// series over the shortest common window. Cross-ticker correlation is NOT
// modelled here, unlike CorrelationGuard; the two views of the same
// portfolio intentionally use different assumptions.
//
// Equity:
//   The sizer caches an equity figure that RiskContext keeps in sync via
//   set_equity(). Negative values clamp to 0. The overloads taking an
//   explicit equity let a caller size against its own consistent snapshot
//   without touching the cached value.
//
// Thread model:
//   Config is immutable. equity_ is guarded by equity_mutex_; every public
//   method is safe to call concurrently.
// -----------------------------------------------------------------------------
class VaRPositionSizer {
 public:
  static constexpr std::size_t kMinObservations = 10;

  // @throws std::invalid_argument if the config is invalid.
  explicit VaRPositionSizer(domain::VaRConfig config = {},
                            double equity = 100'000.0);

  VaRPositionSizer(const VaRPositionSizer&) = delete;
  VaRPositionSizer& operator=(const VaRPositionSizer&) = delete;

  double equity() const;
  void set_equity(double value);

  // -------------------------------------------------------------------------
  // compute_var(returns [, equity])
  // -------------------------------------------------------------------------
  // @brief  Historical VaR/CVaR of `returns` and the position size the
  //         remaining portfolio budget allows at `equity` (default: cached).
  // -------------------------------------------------------------------------
  VaRResult compute_var(const domain::ReturnSeries& returns) const;
  VaRResult compute_var(const domain::ReturnSeries& returns,
                        double equity) const;

  // -------------------------------------------------------------------------
  // size_position(ticker_returns, current_price, existing_var_pct [, equity])
  // -------------------------------------------------------------------------
  // @brief  Maximum position size (account currency) for a candidate whose
  //         history is `ticker_returns`, given `existing_var_pct` of the
  //         portfolio VaR budget already consumed.
  //
  // @return 0.0 if current_price <= 0, equity <= 0 or the budget is
  //         exhausted; see the class comment for the formula.
  // -------------------------------------------------------------------------
  double size_position(const domain::ReturnSeries& ticker_returns,
                       double current_price,
                       double existing_var_pct = 0.0) const;
  double size_position(const domain::ReturnSeries& ticker_returns,
                       double current_price, double existing_var_pct,
                       double equity) const;

  // -------------------------------------------------------------------------
  // compute_portfolio_var(positions_returns, weights [, equity])
  // -------------------------------------------------------------------------
  // @brief  VaR of the weighted-sum synthetic series
  //         s[k] = Σ weights[t] * returns[t][k]
  //         over the shortest common (most recent) window. Tickers without
  //         a weight contribute 0. Empty input yields a zeroed result.
  // -------------------------------------------------------------------------
  VaRResult compute_portfolio_var(
      const domain::ReturnSeriesMap& positions_returns,
      const std::map<std::string, double>& weights) const;
  VaRResult compute_portfolio_var(
      const domain::ReturnSeriesMap& positions_returns,
      const std::map<std::string, double>& weights, double equity) const;

  // cvar_pct or var_pct depending on config.use_cvar.
  double risk_metric(const VaRResult& result) const;

  const domain::VaRConfig& config() const { return config_; }

 private:
  const domain::VaRConfig config_;

  mutable std::mutex equity_mutex_;
  double equity_{0.0};
};

}  // namespace riskcore
