#pragma once

#include "riskcore/correlation/correlation_matrix.hpp"
#include "riskcore/domain/position.hpp"
#include "riskcore/domain/regime.hpp"
#include "riskcore/domain/return_series.hpp"
#include "riskcore/time/time_utils.hpp"
#include "riskcore/var/var_result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace riskcore {
namespace domain {

// -----------------------------------------------------------------------------
// Direction
// -----------------------------------------------------------------------------
// Side of the candidate trade. Accepted and echoed; the current checks are
// direction-agnostic (exposure uses absolute market value).
// -----------------------------------------------------------------------------
enum class Direction {
  Long,
  Short,
};

// -----------------------------------------------------------------------------
// CircuitBreakerStatus
// -----------------------------------------------------------------------------
// State of the externally computed circuit breaker:
//   Closed   → normal operation
//   Open     → every new trade is rejected
//   HalfOpen → trades allowed at half the computed size
// -----------------------------------------------------------------------------
enum class CircuitBreakerStatus {
  Closed,
  Open,
  HalfOpen,
};

const char* to_string(Direction direction);
const char* to_string(CircuitBreakerStatus status);

// Wire names: "long"/"short" and "closed"/"open"/"half_open"
// (case-insensitive). std::nullopt for anything else.
std::optional<Direction> parse_direction(const std::string& name);
std::optional<CircuitBreakerStatus> parse_circuit_breaker_status(
    const std::string& name);

// -----------------------------------------------------------------------------
// AssessmentRequest — one candidate trade presented to RiskContext::assess()
// -----------------------------------------------------------------------------
//
// @details
//   ticker, direction        the candidate trade
//   positions                current open positions
//   returns_by_ticker        daily return history per ticker; empty means
//                            "no history supplied" and skips the
//                            correlation and VaR stages
//   regime                   regime name; absent → configured default
//   circuit_breaker_status   computed by the host's circuit breaker
//   kill_switch_active       computed by the host's kill switch
//   vix                      volatility reading; recorded on the
//                            assessment, does not affect the verdict
// -----------------------------------------------------------------------------
struct AssessmentRequest {
  std::string ticker;
  Direction direction{Direction::Long};
  std::vector<Position> positions;
  ReturnSeriesMap returns_by_ticker;
  std::optional<std::string> regime;
  CircuitBreakerStatus circuit_breaker_status{CircuitBreakerStatus::Closed};
  bool kill_switch_active{false};
  double vix{20.0};
};

// -----------------------------------------------------------------------------
// UnifiedRiskAssessment — the single output of the risk gate
// -----------------------------------------------------------------------------
//
// @brief  Verdict plus every metric computed on the way to it.
//
// @details
// rejection_reason is set iff approved is false. daily_pnl is the engine's
// own accumulator (single source of truth), daily_pnl_pct is its magnitude
// as a percentage of the starting equity of the day.
//
// checks_run lists, in execution order, the checks that actually ran:
//   kill_switch, circuit_breaker, daily_loss_limit, max_positions,
//   single_stock_concentration   always, up to the first rejection
//   correlation_guard, var_sizing   only when enabled and fed with data
//
// correlation_matrix is attached whenever it was computed, including when
// the correlation guard rejected, so the rejection can be inspected.
//
// Thread model:
//   Constructed once per assess() call and returned by value; the caller
//   owns it outright.
// -----------------------------------------------------------------------------
struct UnifiedRiskAssessment {
  bool approved{true};
  std::optional<std::string> rejection_reason;
  std::string ticker;
  Direction direction{Direction::Long};
  double daily_pnl{0.0};
  double daily_pnl_pct{0.0};
  int current_positions{0};
  Regime regime{Regime::Sideways};
  RegimeLimits regime_limits;
  std::optional<CorrelationMatrix> correlation_matrix;
  double concentration_score{0.0};
  std::optional<VaRResult> portfolio_var;
  double max_position_size{0.0};
  CircuitBreakerStatus circuit_breaker_status{CircuitBreakerStatus::Closed};
  bool kill_switch_active{false};
  double vix{20.0};
  std::vector<std::string> warnings;
  std::vector<std::string> checks_run;
  Timestamp timestamp{};
};

}  // namespace domain
}  // namespace riskcore
