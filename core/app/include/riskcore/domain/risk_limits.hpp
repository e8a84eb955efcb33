#pragma once

#include <string>

namespace riskcore {
namespace domain {

// -----------------------------------------------------------------------------
// CorrelationConfig — thresholds for the correlation guard
// -----------------------------------------------------------------------------
//
// @brief  Limits on how correlated a new trade may be with existing holdings.
//
// @details
// Invariant: cluster_threshold <= max_pairwise_correlation. A pair that is
// allowed to coexist may still be grouped into a cluster; the reverse would
// make the cluster limit unreachable. validate() enforces it.
//
// lookback_days is carried for the host that slices the return histories;
// the guard itself uses whatever series it is given.
// -----------------------------------------------------------------------------
struct CorrelationConfig {
  /// A new trade is rejected if |corr| with any holding is above this.
  double max_pairwise_correlation{0.80};

  /// Max tickers allowed in one correlated cluster (candidate included).
  int max_cluster_size{4};

  int lookback_days{60};

  /// Pairs with fewer common observations report correlation 0.0.
  int min_data_points{20};

  /// |corr| at or above this groups two tickers into the same cluster.
  double cluster_threshold{0.70};
};

// -----------------------------------------------------------------------------
// VaRConfig — historical VaR sizing parameters
// -----------------------------------------------------------------------------
//
// @brief  Confidence level and VaR budgets used by VaRPositionSizer.
//
// @details
// Budgets are percentages of equity (2.0 means 2% of equity). When use_cvar
// is true the Expected Shortfall drives budgeting, otherwise plain VaR.
// decay_factor is reserved for exponentially weighted estimates and is not
// applied by the historical estimator.
// -----------------------------------------------------------------------------
struct VaRConfig {
  double confidence_level{0.95};
  double max_portfolio_var_pct{2.0};
  double max_position_var_pct{0.5};
  int lookback_days{252};
  bool use_cvar{true};
  double decay_factor{0.97};
};

// -----------------------------------------------------------------------------
// RiskContextConfig — engine-wide risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable configuration of the unified risk gate.
//
// @details
// Created once (defaults, or parsed from JSON by load_config()) and copied
// into RiskContext at construction. RiskContext stores it const; nothing in
// the engine mutates it afterwards.
//
//   max_daily_loss_pct        daily loss limit, % of starting equity
//   max_concurrent_positions  base count before the regime multiplier
//   max_single_stock_pct      max exposure to one ticker, % of equity;
//                             also the flat fallback position size
//   max_sector_pct            sector exposure limit, % of equity (carried
//                             for hosts and telemetry, see DESIGN.md)
//   default_regime            regime used when a request names none or an
//                             unknown one
//
// Thread model:
//   Plain data struct with value semantics, no shared mutable state.
// -----------------------------------------------------------------------------
struct RiskContextConfig {
  double max_daily_loss_pct{10.0};
  int max_concurrent_positions{10};
  double max_single_stock_pct{15.0};
  double max_sector_pct{30.0};
  CorrelationConfig correlation_config;
  VaRConfig var_config;
  std::string default_regime{"sideways"};
  bool enable_correlation_guard{true};
  bool enable_var_sizing{true};
};

// -------------------------------------------------------------------------
// validate(config)
// -------------------------------------------------------------------------
// @brief  Checks the structural invariants of each config struct.
//
// @throws std::invalid_argument naming the offending field. Called by the
//         component constructors and by the JSON config loader so that a
//         malformed configuration fails at startup, never mid-assessment.
// -------------------------------------------------------------------------
void validate(const CorrelationConfig& config);
void validate(const VaRConfig& config);
void validate(const RiskContextConfig& config);

}  // namespace domain
}  // namespace riskcore
