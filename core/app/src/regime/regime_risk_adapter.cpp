#include "riskcore/regime/regime_risk_adapter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace riskcore {

namespace {

using domain::Regime;
using domain::RegimeLimits;

}  // namespace

const RegimeRiskAdapter::ProfileMap& RegimeRiskAdapter::default_profiles() {
  static const ProfileMap kProfiles = {
      {Regime::Bull,
       RegimeLimits{Regime::Bull, 1.2, 1.2, 1.1, 1.0, 1.2,
                    "Bull market: expanded position sizes and wider stops"}},
      {Regime::Bear,
       RegimeLimits{Regime::Bear, 0.5, 0.6, 0.8, 0.85, 0.8,
                    "Bear market: reduced exposure and tighter correlation "
                    "limits"}},
      {Regime::Sideways,
       RegimeLimits{Regime::Sideways, 0.8, 0.9, 1.0, 1.0, 0.9,
                    "Sideways market: moderately reduced sizing"}},
      {Regime::Crisis,
       RegimeLimits{Regime::Crisis, 0.2, 0.3, 0.5, 0.7, 0.5,
                    "Crisis: minimal exposure, capital preservation"}},
  };
  return kProfiles;
}

RegimeRiskAdapter::RegimeRiskAdapter(domain::Regime default_regime,
                                     ProfileMap profiles)
    : default_regime_(default_regime), profiles_(std::move(profiles)) {
  // Fill any regime the caller did not override.
  for (const auto& [regime, limits] : default_profiles()) {
    profiles_.emplace(regime, limits);
  }
}

domain::Regime RegimeRiskAdapter::resolve(const std::string& name) const {
  return domain::parse_regime(name).value_or(default_regime_);
}

const domain::RegimeLimits& RegimeRiskAdapter::get_limits(
    domain::Regime regime) const {
  // Every Regime has an entry (constructor back-fills), so at() cannot throw.
  return profiles_.at(regime);
}

const domain::RegimeLimits& RegimeRiskAdapter::get_limits(
    const std::string& name) const {
  return get_limits(resolve(name));
}

double RegimeRiskAdapter::adjust_position_size(double base,
                                               const std::string& regime) const {
  return base * get_limits(regime).position_size_mult;
}

int RegimeRiskAdapter::adjust_max_positions(int base,
                                            const std::string& regime) const {
  const double scaled =
      static_cast<double>(base) * get_limits(regime).max_positions_mult;
  return std::max(1, static_cast<int>(std::floor(scaled)));
}

double RegimeRiskAdapter::adjust_stop_distance(double base,
                                               const std::string& regime) const {
  return base * get_limits(regime).stop_loss_mult;
}

double RegimeRiskAdapter::adjust_sector_limit(double base,
                                              const std::string& regime) const {
  return base * get_limits(regime).sector_concentration_mult;
}

double RegimeRiskAdapter::adjust_correlation_threshold(
    double base, const std::string& regime) const {
  return base * get_limits(regime).correlation_threshold_mult;
}

}  // namespace riskcore
