#pragma once

#include <optional>
#include <string>

namespace riskcore {
namespace domain {

// -----------------------------------------------------------------------------
// Regime
// -----------------------------------------------------------------------------
// Closed set of market-condition labels used to scale risk limits. Callers at
// the text boundary pass names ("bull", "bear", "sideways", "crisis"); inside
// the engine the enum is used so lookups are exhaustive.
// -----------------------------------------------------------------------------
enum class Regime {
  Bull,
  Bear,
  Sideways,
  Crisis,
};

// Lower-case wire name of a regime ("bull", "bear", ...).
const char* to_string(Regime regime);

// -------------------------------------------------------------------------
// parse_regime(name)
// -------------------------------------------------------------------------
// @brief  Maps a regime name to the enum.
//
// @return The matching Regime, or std::nullopt for an unknown or empty
//         name. Matching is case-insensitive; surrounding whitespace is not
//         trimmed.
// -------------------------------------------------------------------------
std::optional<Regime> parse_regime(const std::string& name);

// -----------------------------------------------------------------------------
// RegimeLimits — multipliers applied to base risk limits in one regime
// -----------------------------------------------------------------------------
//
// @brief  Immutable profile of five multipliers relative to 1.0 (unchanged).
//
// @details
//   position_size_mult         scales the max position size
//   max_positions_mult         scales the max concurrent position count
//   sector_concentration_mult  scales the max sector exposure
//   correlation_threshold_mult scales the pairwise correlation limit
//   stop_loss_mult             scales stop-loss distance
//
// The four built-in profiles live in RegimeRiskAdapter::default_profiles().
//
// Thread model:
//   Value type; copied into every UnifiedRiskAssessment.
// -----------------------------------------------------------------------------
struct RegimeLimits {
  Regime regime{Regime::Sideways};
  double position_size_mult{1.0};
  double max_positions_mult{1.0};
  double sector_concentration_mult{1.0};
  double correlation_threshold_mult{1.0};
  double stop_loss_mult{1.0};
  std::string description;
};

}  // namespace domain
}  // namespace riskcore
