#include "snowid/core/id128.h"

#include <stdexcept>
#include <string>

namespace snowid::core {

namespace {

void require_fits(const char* field, const std::uint64_t value, const std::uint64_t max) {
  if (value > max) {
    throw std::out_of_range(std::string("Id128: ") + field + " = " + std::to_string(value) +
                            " exceeds maximum " + std::to_string(max));
  }
}

}  // namespace

Id128 Id128::from_fields(const std::uint64_t version, const std::uint64_t timestamp_ms,
                         const std::uint64_t datacenter_id, const std::uint64_t worker_id,
                         const std::uint64_t process_id, const std::uint64_t sequence) {
  require_fits("version", version, kMaxVersion);
  require_fits("datacenter_id", datacenter_id, kMaxDatacenterId);
  require_fits("worker_id", worker_id, kMaxWorkerId);
  require_fits("process_id", process_id, kMaxProcessId);
  require_fits("sequence", sequence, kMaxSequence);

  const std::uint64_t word1 = (version << kVersionShift) | (datacenter_id << kDatacenterIdShift) |
                              (worker_id << kWorkerIdShift) | (process_id << kProcessIdShift) |
                              sequence;
  return Id128(timestamp_ms, word1);
}

}  // namespace snowid::core
