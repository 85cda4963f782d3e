#pragma once

#include <exception>
#include <string>

namespace smartscan_core {

enum class ErrorKind { InvalidConfiguration, NotFound, Transport, Service, MalformedResponse, Cancelled };

std::string to_string(ErrorKind kind);

class SmartScanError : public std::exception {
 public:
  SmartScanError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

// Chunking parameters that can't terminate, bad top_k, rejected dimensions
class InvalidConfigurationError : public SmartScanError {
 public:
  explicit InvalidConfigurationError(const std::string &message)
      : SmartScanError(ErrorKind::InvalidConfiguration, message) {}
};

class NotFoundError : public SmartScanError {
 public:
  explicit NotFoundError(const std::string &message) : SmartScanError(ErrorKind::NotFound, message) {}
};

// Connection failures and timeouts
class TransportError : public SmartScanError {
 public:
  explicit TransportError(const std::string &message) : SmartScanError(ErrorKind::Transport, message) {}
};

// The service answered with a non-success status
class ServiceError : public SmartScanError {
 public:
  ServiceError(long status_code, const std::string &message)
      : SmartScanError(ErrorKind::Service, message), status_code_(status_code) {}

  long status_code() const noexcept {
    return status_code_;
  }

 private:
  long status_code_;
};

class MalformedResponseError : public SmartScanError {
 public:
  explicit MalformedResponseError(const std::string &message)
      : SmartScanError(ErrorKind::MalformedResponse, message) {}
};

class CancelledError : public SmartScanError {
 public:
  explicit CancelledError(const std::string &message = "Operation cancelled")
      : SmartScanError(ErrorKind::Cancelled, message) {}
};

}  // namespace smartscan_core
