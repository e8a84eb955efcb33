#pragma once

#include "riskcore/correlation/correlation_guard.hpp"
#include "riskcore/domain/assessment.hpp"
#include "riskcore/domain/risk_limits.hpp"
#include "riskcore/regime/regime_risk_adapter.hpp"
#include "riskcore/time/i_time_provider.hpp"
#include "riskcore/var/var_position_sizer.hpp"

#include <mutex>
#include <string>

namespace riskcore {

// Consistent view of the mutable account state, taken under one lock.
struct RiskSnapshot {
  double equity{0.0};
  double starting_equity{0.0};
  double daily_pnl{0.0};
};

// -----------------------------------------------------------------------------
// RiskContext
// -----------------------------------------------------------------------------
//
// @brief  The unified risk gate. Owns account equity and the daily P&L
//         accumulator, composes CorrelationGuard, VaRPositionSizer and
//         RegimeRiskAdapter, and answers one question per call: may this
//         trade be opened, and how large may it be?
//
// @details
// assess() is a single pass through ordered, short-circuiting checks. The
// first failing check produces a rejected assessment; nothing is thrown.
//
//   1. kill_switch                 request.kill_switch_active
//   2. circuit_breaker             status Open
//   3. daily_loss_limit            internal daily P&L vs max_daily_loss_pct
//   4. max_positions               regime-adjusted position count
//   5. single_stock_concentration  exposure to the ticker vs equity
//   6. correlation_guard           enabled and histories supplied
//   7. var_sizing                  enabled and the ticker has a history
//
// After the checks the size (VaR-derived, or the flat max_single_stock_pct
// allowance) is scaled by the regime's position_size_mult and halved again
// while the circuit breaker is HalfOpen.
//
// The daily P&L used by check 3 is the engine's own accumulator, fed by
// record_pnl(). Callers never pass a P&L figure in; there is exactly one
// source of truth.
//
// Thread model:
//   equity_, starting_equity_ and daily_pnl_ are guarded by state_mutex_.
//   assess() takes a RiskSnapshot under the lock at entry, releases it and
//   then runs entirely on that snapshot, so concurrent assess() calls never
//   block each other for longer than the copy and never see a torn state.
//   The composed components are either immutable or internally guarded.
//
// Ownership:
//   Owns its three components by value. Holds a const reference to the
//   time provider, which must outlive the RiskContext.
// -----------------------------------------------------------------------------
class RiskContext {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  clock   Source of assessment/matrix timestamps.
  // @param  config  Engine-wide thresholds (copied, then immutable).
  // @param  equity  Starting account equity; negative values clamp to 0.
  //
  // @throws std::invalid_argument if config fails domain::validate().
  // -------------------------------------------------------------------------
  explicit RiskContext(const ITimeProvider& clock,
                       domain::RiskContextConfig config = {},
                       double equity = 100'000.0);

  RiskContext(const RiskContext&) = delete;
  RiskContext& operator=(const RiskContext&) = delete;
  RiskContext(RiskContext&&) = delete;
  RiskContext& operator=(RiskContext&&) = delete;

  // -------------------------------------------------------------------------
  // assess(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs the ordered checks for one candidate trade.
  //
  // @return A fully populated assessment. approved == false iff a check
  //         failed, in which case rejection_reason names it.
  //
  // Thread-safety: Safe to call concurrently with itself and with every
  //                mutator below.
  // Side-effects:  Logs rejections to std::cerr. No state is mutated.
  // -------------------------------------------------------------------------
  domain::UnifiedRiskAssessment assess(
      const domain::AssessmentRequest& request) const;

  // -------------------------------------------------------------------------
  // record_pnl(delta)
  // -------------------------------------------------------------------------
  // @brief  Adds a realized P&L delta (typically one fill) to today's
  //         accumulator. NaN and infinite deltas are logged and ignored.
  // -------------------------------------------------------------------------
  void record_pnl(double delta);

  // -------------------------------------------------------------------------
  // reset_daily()
  // -------------------------------------------------------------------------
  // @brief  Start of a trading day: daily P&L back to 0 and the current
  //         equity becomes the new starting equity.
  // -------------------------------------------------------------------------
  void reset_daily();

  // Clamps to >= 0 and propagates the value to the VaR sizer.
  void set_equity(double value);

  double equity() const;
  double daily_pnl() const;
  RiskSnapshot snapshot() const;

  const domain::RiskContextConfig& config() const { return config_; }
  const RegimeRiskAdapter& regime_adapter() const { return regime_adapter_; }

 private:
  // Builds a rejected assessment from the partially filled `base`.
  domain::UnifiedRiskAssessment reject(domain::UnifiedRiskAssessment base,
                                       std::string reason) const;

  const ITimeProvider& clock_;
  const domain::RiskContextConfig config_;

  CorrelationGuard correlation_guard_;
  VaRPositionSizer var_sizer_;
  RegimeRiskAdapter regime_adapter_;

  mutable std::mutex state_mutex_;
  double equity_{0.0};
  double starting_equity_{0.0};
  double daily_pnl_{0.0};
};

}  // namespace riskcore
