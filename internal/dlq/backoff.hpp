#pragma once

#include <chrono>
#include <cstdint>

namespace audit::dlq {

// initial * 2^(retry_count - 1), capped at max. retry_count counts failed
// replays including the one just observed.
inline std::chrono::milliseconds BackoffDelay(uint32_t retry_count, std::chrono::milliseconds initial,
                                              std::chrono::milliseconds max) {
  if (retry_count == 0) return initial < max ? initial : max;

  auto delay = initial;
  for (uint32_t i = 1; i < retry_count; ++i) {
    if (delay >= max / 2) return max;
    delay *= 2;
  }
  return delay < max ? delay : max;
}

} // namespace audit::dlq
