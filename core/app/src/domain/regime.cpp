#include "riskcore/domain/regime.hpp"

#include <algorithm>
#include <cctype>

namespace riskcore {
namespace domain {

const char* to_string(Regime regime) {
  switch (regime) {
    case Regime::Bull:     return "bull";
    case Regime::Bear:     return "bear";
    case Regime::Sideways: return "sideways";
    case Regime::Crisis:   return "crisis";
  }
  return "sideways";
}

std::optional<Regime> parse_regime(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });

  if (lower == "bull") return Regime::Bull;
  if (lower == "bear") return Regime::Bear;
  if (lower == "sideways") return Regime::Sideways;
  if (lower == "crisis") return Regime::Crisis;
  return std::nullopt;
}

}  // namespace domain
}  // namespace riskcore
