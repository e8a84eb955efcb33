#pragma once

#include <cstddef>

namespace riskcore {

// -----------------------------------------------------------------------------
// VaRResult — historical VaR estimate for one return series
// -----------------------------------------------------------------------------
//
// @brief  Value-at-Risk and Expected Shortfall of a return series, with the
//         position size the remaining portfolio budget allows.
//
// @details
//   var_pct                loss at the confidence percentile, % (3.0 = 3%)
//   cvar_pct               mean loss at or beyond that percentile, %
//   max_position_size      remaining budget converted to account currency
//   risk_budget_remaining  max_portfolio_var_pct minus the driving metric,
//                          floored at 0
//   confidence_level       confidence the estimate was taken at
//   data_points            observations the estimate is based on
//
// A series with fewer than VaRPositionSizer::kMinObservations observations
// yields a zeroed result that only carries data_points and
// confidence_level.
//
// Thread model: value type, created fresh per call.
// -----------------------------------------------------------------------------
struct VaRResult {
  double var_pct{0.0};
  double cvar_pct{0.0};
  double max_position_size{0.0};
  double risk_budget_remaining{0.0};
  double confidence_level{0.95};
  std::size_t data_points{0};
};

}  // namespace riskcore
