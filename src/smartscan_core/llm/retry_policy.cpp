#include "smartscan_core/llm/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "smartscan_core/errors.hpp"

namespace smartscan_core {

RetryPolicy RetryPolicy::none() {
  return RetryPolicy{};
}

RetryPolicy RetryPolicy::exponential(int max_attempts, std::chrono::milliseconds initial_backoff) {
  RetryPolicy policy;
  policy.max_attempts = max_attempts;
  policy.initial_backoff = initial_backoff;
  return policy;
}

bool RetryPolicy::should_retry(const std::exception &error, int attempt) const {
  if (attempt >= max_attempts) {
    return false;
  }
  if (dynamic_cast<const TransportError *>(&error) != nullptr) {
    return retry_on_transport_errors;
  }
  if (const auto *service_error = dynamic_cast<const ServiceError *>(&error)) {
    return retry_on_server_errors && service_error->status_code() >= 500;
  }
  return false;
}

std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) const {
  if (attempt < 1) {
    return std::chrono::milliseconds(0);
  }
  const double scaled = static_cast<double>(initial_backoff.count()) *
                        std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
  const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds(static_cast<long long>(capped));
}

Sleeper default_sleeper() {
  return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

}  // namespace smartscan_core
