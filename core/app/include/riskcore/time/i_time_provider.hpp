#pragma once

#include <cstdint>

namespace riskcore {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source for assessment timestamps
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// Every UnifiedRiskAssessment and CorrelationMatrix is stamped with the time
// it was computed. In production that is the wall clock; in a backtest or a
// unit test it must be the replayed (or fixed) time so repeated runs produce
// identical output.
//
//   - LiveTimeProvider       → std::chrono::system_clock
//   - SimulationTimeProvider → value set explicitly by the caller
//
// RiskContext receives `const ITimeProvider&` and never calls the system
// clock directly.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads, since assess() may be
//   called from several trade-evaluation threads at once.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch (UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace riskcore
