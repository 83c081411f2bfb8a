#include "snowid/core/clock.h"

#include "snowid/core/time.h"

namespace snowid::core {

std::uint64_t SystemClock::now_epoch_millis() {
  return to_unix_millis(now_utc());
}

std::uint64_t FixedClock::now_epoch_millis() {
  return fixed_millis_;
}

std::uint64_t ManualClock::now_epoch_millis() {
  return millis_.load(std::memory_order_acquire);
}

void ManualClock::set(const std::uint64_t millis) {
  millis_.store(millis, std::memory_order_release);
}

void ManualClock::advance(const std::uint64_t delta_millis) {
  millis_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

}  // namespace snowid::core
