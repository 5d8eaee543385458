#ifndef LBFT_CLIENT_RETRY_POLICY_HPP
#define LBFT_CLIENT_RETRY_POLICY_HPP

#include <chrono>
#include <functional>
#include <boost/log/trivial.hpp>
#include "protocol/protocol_error.hpp"

namespace lbft {
namespace client {

/**
 * Re-runs a whole client operation (connect, handshake, transfer) after transient
 * failures. The protocol core never retries by itself; a retried transfer always
 * restarts from the first chunk on a fresh connection.
 */
class RetryPolicy {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  RetryPolicy(unsigned max_attempts = 3,
              std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(500),
              unsigned backoff_multiplier = 2);


  // ---- POLICY ----
  // Timeouts, broken connections and damaged data are worth another attempt
  static bool is_transient(protocol::ErrorKind kind);
  // attempt counts the attempts made so far, starting at 1
  bool should_retry(protocol::ErrorKind kind, unsigned attempt) const;
  // Delay before the attempt following attempt
  std::chrono::milliseconds backoff_for(unsigned attempt) const;


  // ---- EXECUTION ----
  template <typename Operation>
  auto run(Operation&& operation) -> decltype(operation()) {
    for (unsigned attempt = 1;; ++attempt) {
      try {
        return operation();
      } catch (const protocol::ProtocolError& e) {
        if (!should_retry(e.kind(), attempt)) {
          BOOST_LOG_TRIVIAL(error) << "Retry policy: Giving up after attempt " << attempt
                                   << ": " << e.what();
          throw;
        }
        auto delay = backoff_for(attempt);
        BOOST_LOG_TRIVIAL(warning) << "Retry policy: Attempt " << attempt << " of "
                                   << max_attempts_ << " failed (" << e.what()
                                   << "), retrying in " << delay.count() << " ms";
        sleeper_(delay);
      }
    }
  }


  // ---- GETTERS AND SETTERS ----
  unsigned max_attempts() const { return max_attempts_; }
  // Replaces the sleep between attempts
  void set_sleeper(Sleeper sleeper);

private:
  // ---- PARAMETERS ----
  unsigned max_attempts_;
  std::chrono::milliseconds initial_backoff_;
  unsigned backoff_multiplier_;
  Sleeper sleeper_;
};

} // namespace client
} // namespace lbft

#endif // LBFT_CLIENT_RETRY_POLICY_HPP
