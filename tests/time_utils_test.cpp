// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for the time providers and timestamp helpers.
//
// Validates:
//   - ISO-8601 rendering (UTC, millisecond resolution, +00:00 offset)
//   - ms ↔ Timestamp conversion
//   - SimulationTimeProvider only moves when advanced
// =============================================================================

#include "riskcore/time/live_time_provider.hpp"
#include "riskcore/time/simulation_time_provider.hpp"
#include "riskcore/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>

// -----------------------------------------------------------------------------
// 1. Epoch and a known instant render as expected.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, Iso8601Rendering) {
  EXPECT_EQ(riskcore::to_iso8601(riskcore::ms_to_timestamp(0)),
            "1970-01-01T00:00:00.000+00:00");
  EXPECT_EQ(riskcore::to_iso8601(riskcore::ms_to_timestamp(1'700'000'000'123)),
            "2023-11-14T22:13:20.123+00:00");
  EXPECT_EQ(riskcore::to_iso8601(riskcore::ms_to_timestamp(1'000)),
            "1970-01-01T00:00:01.000+00:00");
}

// -----------------------------------------------------------------------------
// 2. Millisecond conversion is lossless.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, MillisecondConversion) {
  const std::int64_t ms = 1'700'000'000'123;
  EXPECT_EQ(riskcore::timestamp_to_ms(riskcore::ms_to_timestamp(ms)), ms);
}

// -----------------------------------------------------------------------------
// 3. The simulated clock holds still until advanced.
// -----------------------------------------------------------------------------
TEST(TimeProviderTest, SimulationClock) {
  riskcore::SimulationTimeProvider clock;
  EXPECT_EQ(clock.now_ms(), 0);

  riskcore::SimulationTimeProvider started{5'000};
  EXPECT_EQ(started.now_ms(), 5'000);
  EXPECT_EQ(started.now_ms(), 5'000);

  started.advance_time(9'000);
  EXPECT_EQ(started.now_ms(), 9'000);
}

// -----------------------------------------------------------------------------
// 4. The live clock is past 2023 and does not run backwards.
// -----------------------------------------------------------------------------
TEST(TimeProviderTest, LiveClock) {
  riskcore::LiveTimeProvider clock;
  const std::int64_t first = clock.now_ms();
  EXPECT_GT(first, 1'700'000'000'000);
  EXPECT_GE(clock.now_ms(), first);
}
