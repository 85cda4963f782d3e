#pragma once

#include <chrono>
#include <exception>
#include <functional>

namespace smartscan_core {

/**
 * @struct RetryPolicy
 * @brief Decides whether a failed request is attempted again and how long to wait first.
 *
 * Attempts are counted from 1. Only TransportError and 5xx ServiceError are retryable;
 * malformed responses, client errors and cancellation always propagate immediately.
 */
struct RetryPolicy {
  int max_attempts = 1;
  std::chrono::milliseconds initial_backoff{500};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{10000};
  bool retry_on_transport_errors = true;
  bool retry_on_server_errors = true;

  // Single attempt, nothing is retried
  static RetryPolicy none();

  static RetryPolicy exponential(int max_attempts, std::chrono::milliseconds initial_backoff);

  // `attempt` is the number of the attempt that just failed
  bool should_retry(const std::exception &error, int attempt) const;

  // Delay before the attempt following `attempt`
  std::chrono::milliseconds backoff_for(int attempt) const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// std::this_thread::sleep_for
Sleeper default_sleeper();

}  // namespace smartscan_core
