#include "client/retry_policy.hpp"
#include <stdexcept>
#include <thread>

namespace lbft {
namespace client {

using protocol::ErrorKind;

RetryPolicy::RetryPolicy(unsigned max_attempts, std::chrono::milliseconds initial_backoff,
                         unsigned backoff_multiplier)
  : max_attempts_(max_attempts)
  , initial_backoff_(initial_backoff)
  , backoff_multiplier_(backoff_multiplier)
  , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
  if (max_attempts_ == 0) {
    throw std::invalid_argument("Retry policy: max_attempts must be at least 1");
  }
  if (backoff_multiplier_ == 0) {
    throw std::invalid_argument("Retry policy: backoff multiplier must be at least 1");
  }
}

bool RetryPolicy::is_transient(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::TIMEOUT:
    case ErrorKind::TRUNCATED:
    case ErrorKind::WRITE_ERROR:
    case ErrorKind::CHECKSUM_MISMATCH:
    case ErrorKind::CORRUPT_PAYLOAD:
      return true;
    default:
      return false;
  }
}

bool RetryPolicy::should_retry(ErrorKind kind, unsigned attempt) const {
  return is_transient(kind) && attempt < max_attempts_;
}

std::chrono::milliseconds RetryPolicy::backoff_for(unsigned attempt) const {
  auto delay = initial_backoff_;
  for (unsigned i = 1; i < attempt; ++i) {
    delay *= backoff_multiplier_;
  }
  return delay;
}

void RetryPolicy::set_sleeper(Sleeper sleeper) {
  sleeper_ = std::move(sleeper);
}

} // namespace client
} // namespace lbft
