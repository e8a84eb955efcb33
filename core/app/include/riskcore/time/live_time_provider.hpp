#pragma once

#include "riskcore/time/i_time_provider.hpp"

namespace riskcore {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::system_clock time in epoch milliseconds.
//
// @details
// Default clock of the riskcore_server binary. Stateless, so a single
// instance can be shared by every RiskContext in the process.
//
// Thread model: No internal state; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace riskcore
