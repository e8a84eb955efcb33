#include "riskcore/codec/json_codec.hpp"

#include "riskcore/time/time_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace riskcore {

namespace {

double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

domain::Position position_from_json(const nlohmann::json& j) {
  domain::Position pos;
  pos.symbol = j.at("symbol").get<std::string>();
  pos.market_value = j.value("market_value", 0.0);
  pos.net_quantity = j.value("net_quantity", 0.0);
  pos.average_price = j.value("average_price", 0.0);
  return pos;
}

}  // namespace

namespace domain {

// -----------------------------------------------------------------------------
// RegimeLimits
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const RegimeLimits& limits) {
  j = nlohmann::json{
      {"regime", to_string(limits.regime)},
      {"position_size_mult", limits.position_size_mult},
      {"max_positions_mult", limits.max_positions_mult},
      {"sector_concentration_mult", limits.sector_concentration_mult},
      {"correlation_threshold_mult", limits.correlation_threshold_mult},
      {"stop_loss_mult", limits.stop_loss_mult},
      {"description", limits.description},
  };
}

// -----------------------------------------------------------------------------
// UnifiedRiskAssessment
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const UnifiedRiskAssessment& a) {
  j = nlohmann::json::object();
  j["approved"] = a.approved;
  j["rejection_reason"] = a.rejection_reason
                              ? nlohmann::json(*a.rejection_reason)
                              : nlohmann::json(nullptr);
  j["ticker"] = a.ticker;
  j["direction"] = to_string(a.direction);
  j["daily_pnl"] = round_to(a.daily_pnl, 2);
  j["daily_pnl_pct"] = round_to(a.daily_pnl_pct, 2);
  j["current_positions"] = a.current_positions;
  j["regime"] = to_string(a.regime);
  j["regime_limits"] = a.regime_limits;
  j["correlation_matrix"] = a.correlation_matrix
                                ? nlohmann::json(*a.correlation_matrix)
                                : nlohmann::json(nullptr);
  j["concentration_score"] = round_to(a.concentration_score, 1);
  j["portfolio_var"] = a.portfolio_var ? nlohmann::json(*a.portfolio_var)
                                       : nlohmann::json(nullptr);
  j["max_position_size"] = round_to(a.max_position_size, 2);
  j["circuit_breaker_status"] = to_string(a.circuit_breaker_status);
  j["kill_switch_active"] = a.kill_switch_active;
  j["vix"] = a.vix;
  j["warnings"] = a.warnings;
  j["checks_run"] = a.checks_run;
  j["timestamp"] = to_iso8601(a.timestamp);
}

}  // namespace domain

// -----------------------------------------------------------------------------
// VaRResult
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const VaRResult& r) {
  j = nlohmann::json{
      {"var_pct", round_to(r.var_pct, 4)},
      {"cvar_pct", round_to(r.cvar_pct, 4)},
      {"max_position_size", round_to(r.max_position_size, 2)},
      {"risk_budget_remaining", round_to(r.risk_budget_remaining, 4)},
      {"confidence_level", r.confidence_level},
      {"data_points", r.data_points},
  };
}

// -----------------------------------------------------------------------------
// CorrelationMatrix
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const CorrelationMatrix& m) {
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& row : m.rows()) {
    nlohmann::json r = nlohmann::json::array();
    for (double v : row) {
      r.push_back(round_to(v, 4));
    }
    rows.push_back(std::move(r));
  }

  j = nlohmann::json::object();
  j["tickers"] = m.tickers();
  j["matrix"] = std::move(rows);
  j["clusters"] = m.clusters();
  j["max_correlation"] = round_to(m.max_correlation(), 4);
  j["computed_at"] = to_iso8601(m.computed_at());
}

// -----------------------------------------------------------------------------
// request_from_json(): ASSESS payload → AssessmentRequest
// -----------------------------------------------------------------------------
domain::AssessmentRequest request_from_json(const nlohmann::json& j) {
  domain::AssessmentRequest req;
  req.ticker = j.at("ticker").get<std::string>();

  const std::string direction = j.value("direction", std::string{"long"});
  auto parsed_direction = domain::parse_direction(direction);
  if (!parsed_direction) {
    throw std::invalid_argument("unknown direction: " + direction);
  }
  req.direction = *parsed_direction;

  if (j.contains("positions")) {
    for (const auto& p : j.at("positions")) {
      req.positions.push_back(position_from_json(p));
    }
  }

  if (j.contains("returns_by_ticker")) {
    req.returns_by_ticker =
        j.at("returns_by_ticker").get<domain::ReturnSeriesMap>();
  }

  if (j.contains("regime") && !j.at("regime").is_null()) {
    req.regime = j.at("regime").get<std::string>();
  }

  const std::string status =
      j.value("circuit_breaker_status", std::string{"closed"});
  auto parsed_status = domain::parse_circuit_breaker_status(status);
  if (!parsed_status) {
    throw std::invalid_argument("unknown circuit_breaker_status: " + status);
  }
  req.circuit_breaker_status = *parsed_status;

  req.kill_switch_active = j.value("kill_switch_active", false);
  req.vix = j.value("vix", 20.0);
  return req;
}

}  // namespace riskcore
