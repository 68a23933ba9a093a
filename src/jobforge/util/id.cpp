#include "jobforge/util/id.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <random>

namespace jobforge::detail {

// Millisecond prefix keeps ids sortable by creation time; the sequence
// number keeps ids created in the same millisecond on one thread ordered.
auto generate_uuid_v7_like() -> std::string {
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  static std::atomic<std::uint32_t> sequence{0};
  const auto now_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  const auto seq = sequence.fetch_add(1, std::memory_order_relaxed) & 0xffffU;
  return std::format("{:012x}{:04x}{:08x}", now_ms, seq, dis(gen));
}

} // namespace jobforge::detail
