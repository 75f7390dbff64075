// core/retry.cpp - Backoff computation
#include "retry.hpp"
#include <cmath>

namespace converge {

std::chrono::milliseconds
RetryPolicy::delay_for_attempt(std::uint32_t attempt) const {
  if (attempt == 0)
    attempt = 1;
  double ms = static_cast<double>(base_delay.count()) *
              std::pow(backoff_factor, static_cast<double>(attempt - 1));
  double cap = static_cast<double>(max_delay.count());
  if (cap > 0 && ms > cap)
    ms = cap;
  return std::chrono::milliseconds(static_cast<long long>(ms));
}

} // namespace converge
