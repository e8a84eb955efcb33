#include "riskcore/time/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace riskcore {

// -----------------------------------------------------------------------------
// to_iso8601(): UTC calendar fields via gmtime_r, milliseconds appended
// -----------------------------------------------------------------------------
std::string to_iso8601(Timestamp tp) {
  std::int64_t total_ms = timestamp_to_ms(tp);

  // Floor division so pre-epoch values still yield a valid [0, 999] ms part.
  std::int64_t seconds = total_ms / 1000;
  std::int64_t millis = total_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&tt, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << millis << "+00:00";
  return out.str();
}

}  // namespace riskcore
