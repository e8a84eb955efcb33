#pragma once

#include "riskcore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace riskcore {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the caller last set.
//
// @details
// Used when assessments are replayed over historical data, and by the unit
// tests, so that assessment timestamps are reproducible. The clock starts at
// the given epoch milliseconds (0 by default) and only moves when
// advance_time() is called.
//
// Monotonicity is the caller's responsibility; advance_time() accepts any
// value.
//
// Thread model:
//   std::atomic<int64_t> storage: one writer (the replay driver) and any
//   number of concurrent readers (assess() calls) without a mutex.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulated clock. Subsequent now_ms() calls from any
  //         thread return new_time_ms.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace riskcore
