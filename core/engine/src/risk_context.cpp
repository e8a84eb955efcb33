#include "riskcore/engine/risk_context.hpp"

#include "riskcore/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace riskcore {

namespace {

constexpr double kHighConcentrationScore = 75.0;
constexpr double kHalfOpenSizeMult = 0.5;

domain::RiskContextConfig checked(domain::RiskContextConfig config) {
  domain::validate(config);
  return config;
}

std::string fixed1(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value;
  return oss.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: validate config, build the components, seed account state
// -----------------------------------------------------------------------------
RiskContext::RiskContext(const ITimeProvider& clock,
                         domain::RiskContextConfig config, double equity)
    : clock_(clock),
      config_(checked(std::move(config))),
      correlation_guard_(config_.correlation_config),
      var_sizer_(config_.var_config, equity),
      regime_adapter_(domain::parse_regime(config_.default_regime)
                          .value_or(domain::Regime::Sideways)),
      equity_(std::max(0.0, equity)),
      starting_equity_(equity_) {}

// -----------------------------------------------------------------------------
// Account state
// -----------------------------------------------------------------------------
void RiskContext::record_pnl(double delta) {
  if (!std::isfinite(delta)) {
    // A NaN accumulator would disable the daily loss limit for the day.
    std::cerr << "[RiskContext] ignoring non-finite P&L delta " << delta
              << "\n";
    return;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  daily_pnl_ += delta;
}

void RiskContext::reset_daily() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  daily_pnl_ = 0.0;
  starting_equity_ = equity_;
  std::cout << "[RiskContext] Daily reset, starting equity=" << equity_
            << "\n";
}

void RiskContext::set_equity(double value) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  equity_ = std::max(0.0, value);
  // Under the same lock so the sizer never lags a concurrent snapshot.
  var_sizer_.set_equity(equity_);
}

double RiskContext::equity() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return equity_;
}

double RiskContext::daily_pnl() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return daily_pnl_;
}

RiskSnapshot RiskContext::snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return RiskSnapshot{equity_, starting_equity_, daily_pnl_};
}

// -----------------------------------------------------------------------------
// reject(): finalize a rejected assessment and log it
// -----------------------------------------------------------------------------
domain::UnifiedRiskAssessment RiskContext::reject(
    domain::UnifiedRiskAssessment base, std::string reason) const {
  std::cerr << "[RiskContext] REJECTED " << base.ticker << ": " << reason
            << "\n";
  base.approved = false;
  base.rejection_reason = std::move(reason);
  base.max_position_size = 0.0;
  return base;
}

// -----------------------------------------------------------------------------
// assess(): ordered short-circuit checks on one consistent snapshot
// -----------------------------------------------------------------------------
domain::UnifiedRiskAssessment RiskContext::assess(
    const domain::AssessmentRequest& request) const {
  const RiskSnapshot state = snapshot();
  const Timestamp now = ms_to_timestamp(clock_.now_ms());

  const domain::Regime regime =
      regime_adapter_.resolve(request.regime.value_or(std::string{}));
  const domain::RegimeLimits& limits = regime_adapter_.get_limits(regime);
  const std::string regime_name = domain::to_string(regime);

  domain::UnifiedRiskAssessment out;
  out.ticker = request.ticker;
  out.direction = request.direction;
  out.daily_pnl = state.daily_pnl;
  out.daily_pnl_pct = std::abs(state.daily_pnl) /
                      std::max(state.starting_equity, 1.0) * 100.0;
  out.current_positions = static_cast<int>(request.positions.size());
  out.regime = regime;
  out.regime_limits = limits;
  out.circuit_breaker_status = request.circuit_breaker_status;
  out.kill_switch_active = request.kill_switch_active;
  out.vix = request.vix;
  out.timestamp = now;

  // --- 1. Kill switch --------------------------------------------------------
  out.checks_run.emplace_back("kill_switch");
  if (request.kill_switch_active) {
    return reject(std::move(out), "Kill switch is active");
  }

  // --- 2. Circuit breaker ----------------------------------------------------
  out.checks_run.emplace_back("circuit_breaker");
  if (request.circuit_breaker_status == domain::CircuitBreakerStatus::Open) {
    return reject(std::move(out), "Circuit breaker is OPEN");
  }

  // --- 3. Daily loss limit (internal accumulator only) -----------------------
  out.checks_run.emplace_back("daily_loss_limit");
  if (state.starting_equity > 0.0 && state.daily_pnl < 0.0) {
    const double loss_pct =
        std::abs(state.daily_pnl) / state.starting_equity * 100.0;
    if (loss_pct >= config_.max_daily_loss_pct) {
      return reject(std::move(out),
                    "Daily loss " + fixed1(loss_pct) + "% >= limit " +
                        fixed1(config_.max_daily_loss_pct) + "%");
    }
  }

  // --- 4. Max concurrent positions (regime-adjusted) -------------------------
  out.checks_run.emplace_back("max_positions");
  const int adjusted_max = regime_adapter_.adjust_max_positions(
      config_.max_concurrent_positions, regime_name);
  if (out.current_positions >= adjusted_max) {
    std::ostringstream reason;
    reason << "Max positions reached: " << out.current_positions << "/"
           << adjusted_max << " (regime=" << regime_name << ")";
    return reject(std::move(out), reason.str());
  }

  // --- 5. Single stock concentration -----------------------------------------
  out.checks_run.emplace_back("single_stock_concentration");
  if (state.equity > 0.0) {
    double exposure = 0.0;
    for (const auto& pos : request.positions) {
      if (pos.symbol == request.ticker) {
        exposure += std::abs(pos.market_value);
      }
    }
    const double exposure_pct = exposure / state.equity * 100.0;
    if (exposure_pct >= config_.max_single_stock_pct) {
      return reject(std::move(out),
                    request.ticker + " exposure " + fixed1(exposure_pct) +
                        "% >= " + fixed1(config_.max_single_stock_pct) + "%");
    }
  }

  // --- 6. Correlation guard --------------------------------------------------
  if (config_.enable_correlation_guard && !request.returns_by_ticker.empty()) {
    out.checks_run.emplace_back("correlation_guard");
    CorrelationMatrix matrix =
        correlation_guard_.compute_matrix(request.returns_by_ticker, now);

    std::vector<std::string> holdings;
    holdings.reserve(request.positions.size());
    for (const auto& pos : request.positions) {
      holdings.push_back(pos.symbol);
    }

    const CorrelationCheck check =
        correlation_guard_.check_new_trade(request.ticker, matrix, holdings);
    if (!check.approved) {
      out.correlation_matrix = std::move(matrix);
      return reject(std::move(out), check.reason);
    }

    // Concentration of the post-trade book: distinct holdings + candidate.
    std::vector<std::string> post_trade;
    for (const auto& symbol : holdings) {
      if (std::find(post_trade.begin(), post_trade.end(), symbol) ==
          post_trade.end()) {
        post_trade.push_back(symbol);
      }
    }
    if (std::find(post_trade.begin(), post_trade.end(), request.ticker) ==
        post_trade.end()) {
      post_trade.push_back(request.ticker);
    }

    out.concentration_score =
        correlation_guard_.get_portfolio_concentration_score(matrix,
                                                             post_trade);
    if (out.concentration_score > kHighConcentrationScore) {
      std::ostringstream warning;
      warning << "High portfolio concentration: " << std::fixed
              << std::setprecision(0) << out.concentration_score << "/100";
      std::cerr << "[RiskContext] WARNING " << request.ticker << ": "
                << warning.str() << "\n";
      out.warnings.push_back(warning.str());
    }
    out.correlation_matrix = std::move(matrix);
  }

  // --- 7. VaR sizing ---------------------------------------------------------
  double size = config_.max_single_stock_pct / 100.0 * state.equity;
  if (config_.enable_var_sizing) {
    auto it = request.returns_by_ticker.find(request.ticker);
    if (it != request.returns_by_ticker.end() && !it->second.empty()) {
      out.checks_run.emplace_back("var_sizing");
      out.portfolio_var = var_sizer_.compute_var(it->second, state.equity);
      size = var_sizer_.size_position(
          it->second, 1.0, out.portfolio_var->var_pct, state.equity);
    }
  }

  // --- 8. Regime and circuit-breaker scaling ---------------------------------
  size = regime_adapter_.adjust_position_size(size, regime_name);
  if (request.circuit_breaker_status ==
      domain::CircuitBreakerStatus::HalfOpen) {
    size *= kHalfOpenSizeMult;
  }

  out.approved = true;
  out.max_position_size = size;
  return out;
}

}  // namespace riskcore
