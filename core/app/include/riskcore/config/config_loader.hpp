#pragma once

#include "riskcore/domain/risk_limits.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace riskcore {

// Raised when a configuration document cannot be read, parsed, or fails
// validation. The message names the file or field involved.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// parse_config(j)
// -----------------------------------------------------------------------------
//
// @brief  Builds a RiskContextConfig from a JSON object.
//
// @details
// Every key is optional; a missing key keeps the default. Layout:
//
//   {
//     "max_daily_loss_pct": 10.0,
//     "max_concurrent_positions": 10,
//     "max_single_stock_pct": 15.0,
//     "max_sector_pct": 30.0,
//     "default_regime": "sideways",
//     "enable_correlation_guard": true,
//     "enable_var_sizing": true,
//     "correlation": { "max_pairwise_correlation": 0.80,
//                      "max_cluster_size": 4, "lookback_days": 60,
//                      "min_data_points": 20, "cluster_threshold": 0.70 },
//     "var": { "confidence_level": 0.95, "max_portfolio_var_pct": 2.0,
//              "max_position_var_pct": 0.5, "lookback_days": 252,
//              "use_cvar": true, "decay_factor": 0.97 }
//   }
//
// @throws ConfigError on a mistyped value or a config that fails
//         domain::validate().
// -----------------------------------------------------------------------------
domain::RiskContextConfig parse_config(const nlohmann::json& j);

// -----------------------------------------------------------------------------
// load_config(path)
// -----------------------------------------------------------------------------
// @brief  Reads and parses the JSON file at `path` via parse_config().
// @throws ConfigError if the file is missing, is not valid JSON, or fails
//         parse_config().
// -----------------------------------------------------------------------------
domain::RiskContextConfig load_config(const std::string& path);

}  // namespace riskcore
