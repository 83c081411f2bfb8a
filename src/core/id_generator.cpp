#include "snowid/core/id_generator.h"

#include <utility>

namespace snowid::core {

Result<std::shared_ptr<SnowflakeGenerator>, ConfigError> SnowflakeGenerator::create(
    std::shared_ptr<IClock> clock, const GeneratorConfig& config) {
  using R = Result<std::shared_ptr<SnowflakeGenerator>, ConfigError>;

  if (!clock) {
    return R::err(ConfigError{ConfigField::kClock, 0, 0});
  }

  const auto validated = validate_generator_config(config);
  if (!validated.has_value()) {
    return R::err(validated.error());
  }

  // Private constructor: std::make_shared cannot reach it.
  return R::ok(std::shared_ptr<SnowflakeGenerator>(
      new SnowflakeGenerator(std::move(clock), validated.value())));
}

SnowflakeGenerator::SnowflakeGenerator(std::shared_ptr<IClock> clock,
                                       const GeneratorConfig& config)
    : clock_(std::move(clock)), config_(config) {
  state_.sequence = config_.default_sequence;
}

Result<Id128, GenerateError> SnowflakeGenerator::generate() {
  using R = Result<Id128, GenerateError>;

  std::lock_guard<std::mutex> lock(mutex_);

  const std::uint64_t now = clock_->now_epoch_millis();

  if (state_.last_timestamp.has_value() && now < *state_.last_timestamp) {
    return R::err(GenerateError{GenerateErrorKind::kClockRegression,
                                *state_.last_timestamp - now});
  }

  if (state_.sequence >= Id128::kMaxSequence) {
    return R::err(GenerateError{GenerateErrorKind::kSequenceExhausted,
                                state_.sequence - Id128::kMaxSequence});
  }

  // Commit both fields together; nothing above this line touched state_.
  state_.sequence = state_.last_timestamp == now ? state_.sequence + 1 : config_.default_sequence;
  state_.last_timestamp = now;

  return R::ok(Id128::from_fields(config_.version, now, config_.datacenter_id,
                                  config_.worker_id, config_.process_id, state_.sequence));
}

}  // namespace snowid::core
