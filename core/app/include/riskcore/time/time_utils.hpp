#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace riskcore {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time point carried by assessments and correlation matrices.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridge between ITimeProvider's int64 milliseconds and Timestamp,
//         plus the ISO-8601 rendering used in JSON telemetry.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// to_iso8601(tp)
// -------------------------------------------------------------------------
// @brief  Formats a Timestamp as UTC "YYYY-MM-DDTHH:MM:SS.mmm+00:00".
//
// @details
// Millisecond resolution with an explicit +00:00 offset, so telemetry
// consumers parse it as timezone-aware UTC.
// -------------------------------------------------------------------------
std::string to_iso8601(Timestamp tp);

}  // namespace riskcore
