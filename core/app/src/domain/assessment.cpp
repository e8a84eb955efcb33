#include "riskcore/domain/assessment.hpp"

#include <algorithm>
#include <cctype>

namespace riskcore {
namespace domain {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

}  // namespace

const char* to_string(Direction direction) {
  switch (direction) {
    case Direction::Long:  return "long";
    case Direction::Short: return "short";
  }
  return "long";
}

const char* to_string(CircuitBreakerStatus status) {
  switch (status) {
    case CircuitBreakerStatus::Closed:   return "closed";
    case CircuitBreakerStatus::Open:     return "open";
    case CircuitBreakerStatus::HalfOpen: return "half_open";
  }
  return "closed";
}

std::optional<Direction> parse_direction(const std::string& name) {
  const std::string lower = to_lower(name);
  if (lower == "long") return Direction::Long;
  if (lower == "short") return Direction::Short;
  return std::nullopt;
}

std::optional<CircuitBreakerStatus> parse_circuit_breaker_status(
    const std::string& name) {
  const std::string lower = to_lower(name);
  if (lower == "closed") return CircuitBreakerStatus::Closed;
  if (lower == "open") return CircuitBreakerStatus::Open;
  if (lower == "half_open") return CircuitBreakerStatus::HalfOpen;
  return std::nullopt;
}

}  // namespace domain
}  // namespace riskcore
