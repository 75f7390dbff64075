// core/retry.hpp - Bounded retry with exponential backoff
#pragma once

#include "error.hpp"
#include "../utils.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace converge {

struct RetryPolicy {
  std::uint32_t max_attempts = 1;
  std::chrono::milliseconds base_delay{0};
  double backoff_factor = 2.0;
  std::chrono::milliseconds max_delay{0};

  static RetryPolicy none() { return RetryPolicy(); }

  // Delay after the given failed attempt (1-based)
  std::chrono::milliseconds delay_for_attempt(std::uint32_t attempt) const;
};

// Runs op until it succeeds, throws a non-retryable error, or the attempts
// are used up. The last error is rethrown.
template <typename Op>
auto with_retry(const RetryPolicy &policy, const std::string &what, Op &&op)
    -> decltype(op()) {
  std::uint32_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      return op();
    } catch (const Error &e) {
      if (!e.retryable() || attempt >= attempts)
        throw;
      auto delay = policy.delay_for_attempt(attempt);
      LOG_WARN(what + " failed (attempt " + std::to_string(attempt) + "/" +
               std::to_string(attempts) + "), retrying in " +
               std::to_string(delay.count()) + "ms: " + e.what());
      if (delay.count() > 0)
        std::this_thread::sleep_for(delay);
    }
  }
}

} // namespace converge
