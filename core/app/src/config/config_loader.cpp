#include "riskcore/config/config_loader.hpp"

#include <fstream>
#include <iostream>

namespace riskcore {

namespace {

// Overwrites `field` with j[key] when present; throws json::type_error when
// the value has the wrong type.
template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& field) {
  auto it = j.find(key);
  if (it != j.end()) {
    field = it->template get<T>();
  }
}

void read_correlation(const nlohmann::json& j,
                      domain::CorrelationConfig& cfg) {
  read_optional(j, "max_pairwise_correlation", cfg.max_pairwise_correlation);
  read_optional(j, "max_cluster_size", cfg.max_cluster_size);
  read_optional(j, "lookback_days", cfg.lookback_days);
  read_optional(j, "min_data_points", cfg.min_data_points);
  read_optional(j, "cluster_threshold", cfg.cluster_threshold);
}

void read_var(const nlohmann::json& j, domain::VaRConfig& cfg) {
  read_optional(j, "confidence_level", cfg.confidence_level);
  read_optional(j, "max_portfolio_var_pct", cfg.max_portfolio_var_pct);
  read_optional(j, "max_position_var_pct", cfg.max_position_var_pct);
  read_optional(j, "lookback_days", cfg.lookback_days);
  read_optional(j, "use_cvar", cfg.use_cvar);
  read_optional(j, "decay_factor", cfg.decay_factor);
}

}  // namespace

// -----------------------------------------------------------------------------
// parse_config(): JSON object → validated RiskContextConfig
// -----------------------------------------------------------------------------
domain::RiskContextConfig parse_config(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  domain::RiskContextConfig cfg;
  try {
    read_optional(j, "max_daily_loss_pct", cfg.max_daily_loss_pct);
    read_optional(j, "max_concurrent_positions", cfg.max_concurrent_positions);
    read_optional(j, "max_single_stock_pct", cfg.max_single_stock_pct);
    read_optional(j, "max_sector_pct", cfg.max_sector_pct);
    read_optional(j, "default_regime", cfg.default_regime);
    read_optional(j, "enable_correlation_guard", cfg.enable_correlation_guard);
    read_optional(j, "enable_var_sizing", cfg.enable_var_sizing);

    if (j.contains("correlation")) {
      read_correlation(j.at("correlation"), cfg.correlation_config);
    }
    if (j.contains("var")) {
      read_var(j.at("var"), cfg.var_config);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("malformed config: ") + e.what());
  }

  try {
    domain::validate(cfg);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
  return cfg;
}

// -----------------------------------------------------------------------------
// load_config(): read file, parse, validate
// -----------------------------------------------------------------------------
domain::RiskContextConfig load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }

  domain::RiskContextConfig cfg = parse_config(j);
  std::cout << "[Config] loaded " << path << "\n";
  return cfg;
}

}  // namespace riskcore
