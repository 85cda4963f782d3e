#include "smartscan_core/errors.hpp"

namespace smartscan_core {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidConfiguration:
      return "InvalidConfiguration";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::Transport:
      return "Transport";
    case ErrorKind::Service:
      return "Service";
    case ErrorKind::MalformedResponse:
      return "MalformedResponse";
    case ErrorKind::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace smartscan_core
