#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace snowid::core {

// Id128 is a 128-bit Snowflake-family identifier held as two 64-bit words.
//
// Layout:
//   word0: raw timestamp, milliseconds since the Unix epoch (unshifted, no epoch offset)
//   word1, most to least significant bit:
//     [63..60] version        4 bits
//     [59..50] datacenter id 10 bits
//     [49..40] worker id     10 bits
//     [39..30] process id    10 bits
//     [29..0]  sequence      30 bits
//
// Value type: immutable after construction, equality/ordering/hashing over (word0, word1).
// The wire order is always word0 first (see id128_codec.h).
class Id128 {
 public:
  static constexpr std::uint64_t kMaxVersion = 0xF;
  static constexpr std::uint64_t kMaxDatacenterId = 0x3FF;
  static constexpr std::uint64_t kMaxWorkerId = 0x3FF;
  static constexpr std::uint64_t kMaxProcessId = 0x3FF;
  static constexpr std::uint64_t kMaxSequence = 0x3FFFFFFF;

  static constexpr int kVersionShift = 60;
  static constexpr int kDatacenterIdShift = 50;
  static constexpr int kWorkerIdShift = 40;
  static constexpr int kProcessIdShift = 30;

  // All-zero identifier.
  constexpr Id128() = default;

  // Wraps two raw words without validation (e.g. identifiers read back from storage).
  [[nodiscard]] static constexpr Id128 from_words(std::uint64_t word0, std::uint64_t word1) {
    return Id128(word0, word1);
  }

  // Packs logical fields. Throws std::out_of_range naming the first field that
  // does not fit its bit width; nothing is truncated.
  [[nodiscard]] static Id128 from_fields(std::uint64_t version, std::uint64_t timestamp_ms,
                                         std::uint64_t datacenter_id, std::uint64_t worker_id,
                                         std::uint64_t process_id, std::uint64_t sequence);

  [[nodiscard]] constexpr std::uint64_t word0() const { return word0_; }
  [[nodiscard]] constexpr std::uint64_t word1() const { return word1_; }

  [[nodiscard]] constexpr std::uint64_t version() const { return word1_ >> kVersionShift; }
  [[nodiscard]] constexpr std::uint64_t timestamp_ms() const { return word0_; }
  [[nodiscard]] constexpr std::uint64_t datacenter_id() const {
    return (word1_ >> kDatacenterIdShift) & kMaxDatacenterId;
  }
  [[nodiscard]] constexpr std::uint64_t worker_id() const {
    return (word1_ >> kWorkerIdShift) & kMaxWorkerId;
  }
  [[nodiscard]] constexpr std::uint64_t process_id() const {
    return (word1_ >> kProcessIdShift) & kMaxProcessId;
  }
  [[nodiscard]] constexpr std::uint64_t sequence() const { return word1_ & kMaxSequence; }

  auto operator<=>(const Id128&) const = default;  // lexicographic over (word0, word1)

 private:
  constexpr Id128(std::uint64_t word0, std::uint64_t word1) : word0_(word0), word1_(word1) {}

  std::uint64_t word0_{0};
  std::uint64_t word1_{0};
};

}  // namespace snowid::core

namespace std {

template <>
struct hash<snowid::core::Id128> {
  std::size_t operator()(const snowid::core::Id128& id) const noexcept {
    const std::size_t h0 = std::hash<std::uint64_t>{}(id.word0());
    const std::size_t h1 = std::hash<std::uint64_t>{}(id.word1());
    return h0 ^ (h1 + 0x9e3779b97f4a7c15ull + (h0 << 6) + (h0 >> 2));
  }
};

}  // namespace std
