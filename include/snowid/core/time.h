#pragma once

#include <chrono>
#include <cstdint>

namespace snowid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

// to_unix_millis clamps time points before the Unix epoch to 0.
inline std::uint64_t to_unix_millis(const Timestamp ts) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  return millis < 0 ? 0 : static_cast<std::uint64_t>(millis);
}

}  // namespace snowid::core
