#pragma once

#include "riskcore/correlation/correlation_matrix.hpp"
#include "riskcore/domain/assessment.hpp"
#include "riskcore/domain/regime.hpp"
#include "riskcore/var/var_result.hpp"

#include <nlohmann/json.hpp>

namespace riskcore {

// -----------------------------------------------------------------------------
// JSON codec — wire shape of the risk gate's inputs and outputs
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json conversions used for telemetry, the command
//         protocol and tests.
//
// @details
// The to_json overloads are found by ADL, so `nlohmann::json j = result;`
// works for every type below. Keys:
//
//   RegimeLimits     regime, position_size_mult, max_positions_mult,
//                    sector_concentration_mult, correlation_threshold_mult,
//                    stop_loss_mult, description
//   VaRResult        var_pct, cvar_pct, max_position_size,
//                    risk_budget_remaining, confidence_level, data_points
//   CorrelationMatrix
//                    tickers, matrix (rows), clusters, max_correlation,
//                    computed_at
//   UnifiedRiskAssessment
//                    approved, rejection_reason (null when approved),
//                    ticker, direction, daily_pnl, daily_pnl_pct,
//                    current_positions, regime, regime_limits,
//                    correlation_matrix (null unless computed),
//                    concentration_score, portfolio_var (null unless
//                    computed), max_position_size, circuit_breaker_status,
//                    kill_switch_active, vix, warnings, checks_run,
//                    timestamp
//
// Rounding: money and percentages of equity to 2 decimals, the
// concentration score to 1, VaR percentages and correlations to 4.
// Timestamps are ISO-8601 UTC (see to_iso8601()).
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------

namespace domain {

void to_json(nlohmann::json& j, const RegimeLimits& limits);
void to_json(nlohmann::json& j, const UnifiedRiskAssessment& assessment);

}  // namespace domain

void to_json(nlohmann::json& j, const VaRResult& result);
void to_json(nlohmann::json& j, const CorrelationMatrix& matrix);

// -----------------------------------------------------------------------------
// request_from_json(j)
// -----------------------------------------------------------------------------
//
// @brief  Parses an ASSESS payload into an AssessmentRequest.
//
// @details
// Expected shape (only "ticker" is required):
//
//   {
//     "ticker": "AAPL",
//     "direction": "long",
//     "positions": [{"symbol": "MSFT", "market_value": 5000.0,
//                    "net_quantity": 10, "average_price": 500.0}],
//     "returns_by_ticker": {"AAPL": [0.01, -0.02, ...]},
//     "regime": "bull",
//     "circuit_breaker_status": "closed",
//     "kill_switch_active": false,
//     "vix": 18.5
//   }
//
// A null or missing "regime" means "use the default regime".
//
// @throws nlohmann::json::exception on missing/mistyped fields, and
//         std::invalid_argument for an unknown direction or circuit breaker
//         status. An unrecognised circuit breaker state must never be read
//         as "closed".
// -----------------------------------------------------------------------------
domain::AssessmentRequest request_from_json(const nlohmann::json& j);

}  // namespace riskcore
