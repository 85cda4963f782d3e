#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "smartscan_core/errors.hpp"

namespace smartscan_core::async {

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag shared between a caller and a running operation.
 *
 * Copies share the same flag. A default-constructed token can still be cancelled; callers
 * that never intend to cancel simply never call cancel().
 */
class CancellationToken {
 public:
  CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const noexcept {
    cancelled_->store(true);
  }

  bool is_cancelled() const noexcept {
    return cancelled_->load();
  }

  void throw_if_cancelled(const std::string& what = "Operation cancelled") const {
    if (is_cancelled()) {
      throw CancelledError(what);
    }
  }

  // Raw flag, for signal handlers that can't touch the shared_ptr
  std::atomic<bool>* flag() const noexcept {
    return cancelled_.get();
  }

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace smartscan_core::async
