#include "exprune/retention/bucket.hpp"

namespace exprune::retention {

auto age_in_days(time_point now, time_point timestamp) noexcept -> std::optional<std::uint64_t> {
  if (timestamp > now) return std::nullopt;
  // Subtract in seconds: timestamp may be time_point::min() for clamped stat values.
  using std::chrono::seconds;
  const auto now_s = std::chrono::duration_cast<seconds>(now.time_since_epoch()).count();
  const auto ts_s = std::chrono::duration_cast<seconds>(timestamp.time_since_epoch()).count();
  return (static_cast<std::uint64_t>(now_s) - static_cast<std::uint64_t>(ts_s)) / kSecondsPerDay;
}

} // namespace exprune::retention
