#include "batchforge/util/id.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace batchforge::detail {

// 48-bit millisecond timestamp, then a per-process counter mixed with random
// bits, so ids sort roughly by creation time and never collide in-process.
auto generate_uuid_v7_like() -> std::string {
  static std::atomic<std::uint32_t> counter{0};
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  const auto now_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  const auto seq = counter.fetch_add(1, std::memory_order_relaxed);
  return std::format("{:012x}{:08x}{:08x}", now_ms & 0xffffffffffffULL, seq,
                     dis(gen));
}

} // namespace batchforge::detail
