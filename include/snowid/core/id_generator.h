#pragma once

#include "snowid/core/clock.h"
#include "snowid/core/generator_config.h"
#include "snowid/core/id128.h"
#include "snowid/core/result.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace snowid::core {

// Abstract ID generator interface for dependency injection.
// Apps and services receive a generator explicitly through this interface;
// there is no process-wide default instance.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate the next identifier, or a typed refusal.
  // Contract: never returns a partially valid identifier.
  [[nodiscard]] virtual Result<Id128, GenerateError> generate() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// SnowflakeGenerator produces monotonic Id128 values from an injected clock and
// fixed node coordinates.
//
// Thread-safety: one std::mutex guards the whole read-clock / compare / update / pack
// sequence, so ids emitted by one instance are totally ordered by lock acquisition.
//
// Per instance, in call order, (timestamp_ms, sequence) strictly increases:
// - same millisecond as the previous id: sequence + 1
// - later millisecond (or first call):   default_sequence
//
// Failure modes (state is never modified on failure):
// - clock reports a time before the last used timestamp -> kClockRegression{by = last - now}
// - the stored sequence has reached kMaxSequence        -> kSequenceExhausted{by = sequence - kMaxSequence}
//
// The exhaustion check runs on the stored sequence before the millisecond comparison,
// so once kMaxSequence has been issued every later call fails, including calls in a
// later millisecond. A millisecond holds at most kMaxSequence - default_sequence + 1 ids;
// default_sequence == kMaxSequence fails on the first call.
class SnowflakeGenerator final : public IIdGenerator {
 public:
  // create validates config and returns a shared handle, or the first ConfigError.
  // A null clock is rejected with ConfigField::kClock.
  [[nodiscard]] static Result<std::shared_ptr<SnowflakeGenerator>, ConfigError> create(
      std::shared_ptr<IClock> clock, const GeneratorConfig& config);

  ~SnowflakeGenerator() override = default;

  // Not copyable or movable (contains mutex and generation state)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  [[nodiscard]] Result<Id128, GenerateError> generate() override;

  [[nodiscard]] const GeneratorConfig& config() const { return config_; }

 private:
  struct State {
    std::optional<std::uint64_t> last_timestamp;
    std::uint64_t sequence{0};
  };

  SnowflakeGenerator(std::shared_ptr<IClock> clock, const GeneratorConfig& config);

  std::shared_ptr<IClock> clock_;
  const GeneratorConfig config_;

  std::mutex mutex_;
  State state_;  // guarded by mutex_
};

}  // namespace snowid::core
