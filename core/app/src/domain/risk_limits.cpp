#include "riskcore/domain/risk_limits.hpp"
#include "riskcore/domain/regime.hpp"

#include <stdexcept>

namespace riskcore {
namespace domain {

void validate(const CorrelationConfig& config) {
  if (config.max_pairwise_correlation < 0.0 ||
      config.max_pairwise_correlation > 1.0) {
    throw std::invalid_argument(
        "correlation.max_pairwise_correlation must be within [0, 1]");
  }
  if (config.cluster_threshold < 0.0 ||
      config.cluster_threshold > config.max_pairwise_correlation) {
    throw std::invalid_argument(
        "correlation.cluster_threshold must be within "
        "[0, max_pairwise_correlation]");
  }
  if (config.max_cluster_size < 2) {
    throw std::invalid_argument("correlation.max_cluster_size must be >= 2");
  }
  if (config.min_data_points < 2) {
    throw std::invalid_argument("correlation.min_data_points must be >= 2");
  }
}

void validate(const VaRConfig& config) {
  if (config.confidence_level <= 0.0 || config.confidence_level >= 1.0) {
    throw std::invalid_argument("var.confidence_level must be within (0, 1)");
  }
  if (config.max_portfolio_var_pct < 0.0 ||
      config.max_position_var_pct < 0.0) {
    throw std::invalid_argument("var budgets must be non-negative");
  }
}

void validate(const RiskContextConfig& config) {
  if (config.max_daily_loss_pct <= 0.0) {
    throw std::invalid_argument("max_daily_loss_pct must be positive");
  }
  if (config.max_concurrent_positions < 1) {
    throw std::invalid_argument("max_concurrent_positions must be >= 1");
  }
  if (config.max_single_stock_pct <= 0.0 || config.max_sector_pct <= 0.0) {
    throw std::invalid_argument("exposure limits must be positive");
  }
  if (!parse_regime(config.default_regime).has_value()) {
    throw std::invalid_argument("unknown default_regime: " +
                                config.default_regime);
  }
  validate(config.correlation_config);
  validate(config.var_config);
}

}  // namespace domain
}  // namespace riskcore
