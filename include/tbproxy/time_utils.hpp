#pragma once
#include <chrono>
#include <cstdint>

namespace tbproxy {

// Milliseconds since the Unix epoch (the timestamp unit of ThingsBoard and of
// our error payloads).
inline std::int64_t unix_millis_now() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// Whole seconds in d, rounded up. Zero or negative durations give 0.
inline std::int64_t ceil_seconds(std::chrono::steady_clock::duration d) {
  if (d <= std::chrono::steady_clock::duration::zero())
    return 0;
  auto s = std::chrono::duration_cast<std::chrono::seconds>(d);
  if (s < d)
    ++s;
  return s.count();
}

// Projects a steady-clock instant onto Unix seconds, using one reading of each
// clock taken at (roughly) the same moment.
inline std::int64_t unix_seconds_at(std::chrono::steady_clock::time_point at,
                                    std::chrono::steady_clock::time_point steady_now,
                                    std::chrono::system_clock::time_point wall_now) {
  const auto wall =
      wall_now + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                     at - steady_now);
  return std::chrono::duration_cast<std::chrono::seconds>(wall.time_since_epoch())
      .count();
}

} // namespace tbproxy
