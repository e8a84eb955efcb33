#pragma once

#include "riskcore/domain/regime.hpp"

#include <map>
#include <string>

namespace riskcore {

// -----------------------------------------------------------------------------
// RegimeRiskAdapter — scales base risk limits by market regime
// -----------------------------------------------------------------------------
//
// @brief  Holds one RegimeLimits profile per Regime and applies its
//         multipliers to position size, position count, stop distance,
//         sector limit and correlation threshold.
//
// @details
// Built-in profiles (size / max-positions / sector / corr-threshold / stop):
//
//   bull      1.2  1.2  1.1  1.0   1.2
//   bear      0.5  0.6  0.8  0.85  0.8
//   sideways  0.8  0.9  1.0  1.0   0.9
//   crisis    0.2  0.3  0.5  0.7   0.5
//
// A custom profile map can replace them at construction; regimes missing
// from a custom map fall back to the built-in profile.
//
// The regime is an explicit argument of every call. The adapter keeps no
// "current regime" of its own, so concurrent assessments under different
// regimes cannot race. Unknown or empty regime names resolve to the
// configured default regime (sideways unless configured otherwise), never
// to an error.
//
// Thread model:
//   Immutable after construction; all methods are const and thread-safe.
// -----------------------------------------------------------------------------
class RegimeRiskAdapter {
 public:
  using ProfileMap = std::map<domain::Regime, domain::RegimeLimits>;

  // The four built-in profiles.
  static const ProfileMap& default_profiles();

  // @param default_regime  Regime used for unknown/empty names.
  // @param profiles        Replacement profiles (empty = built-ins).
  explicit RegimeRiskAdapter(domain::Regime default_regime =
                                 domain::Regime::Sideways,
                             ProfileMap profiles = {});

  domain::Regime default_regime() const { return default_regime_; }

  // -------------------------------------------------------------------------
  // resolve(name)
  // -------------------------------------------------------------------------
  // @return parse_regime(name), or the default regime if that fails.
  // -------------------------------------------------------------------------
  domain::Regime resolve(const std::string& name) const;

  const domain::RegimeLimits& get_limits(domain::Regime regime) const;
  const domain::RegimeLimits& get_limits(const std::string& name = {}) const;

  // base * position_size_mult
  double adjust_position_size(double base, const std::string& regime = {}) const;

  // max(1, floor(base * max_positions_mult))
  int adjust_max_positions(int base, const std::string& regime = {}) const;

  // base * stop_loss_mult
  double adjust_stop_distance(double base, const std::string& regime = {}) const;

  // base * sector_concentration_mult
  double adjust_sector_limit(double base, const std::string& regime = {}) const;

  // base * correlation_threshold_mult
  double adjust_correlation_threshold(double base,
                                      const std::string& regime = {}) const;

  const ProfileMap& all_profiles() const { return profiles_; }

 private:
  domain::Regime default_regime_;
  ProfileMap profiles_;
};

}  // namespace riskcore
