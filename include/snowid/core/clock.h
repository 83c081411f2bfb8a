#pragma once

#include <atomic>
#include <cstdint>

namespace snowid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos use fixed or manually driven time.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current time as milliseconds since the Unix epoch.
  // Contract: cheap and non-blocking; callers treat any decrease as an error condition.
  virtual std::uint64_t now_epoch_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_epoch_millis() override;
};

// Fixed clock: returns constant timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::uint64_t now_epoch_millis() override;

 private:
  std::uint64_t fixed_millis_;
};

// Manual clock: returns whatever was last set. Thread-safe; readers and the
// driving thread may run concurrently.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::uint64_t initial_millis) : millis_(initial_millis) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::uint64_t now_epoch_millis() override;

  void set(std::uint64_t millis);
  void advance(std::uint64_t delta_millis);

 private:
  std::atomic<std::uint64_t> millis_;
};

}  // namespace snowid::core
