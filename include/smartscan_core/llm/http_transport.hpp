#pragma once

#include <chrono>
#include <string>

namespace smartscan_core {

struct HttpResponse {
  long status_code = 0;
  std::string body;

  bool is_success() const {
    return status_code >= 200 && status_code < 300;
  }
};

/**
 * @class HttpTransport
 * @brief Minimal request/response seam the Ollama client talks through.
 *
 * Implementations return any response the server produced, whatever its status, and
 * throw TransportError when no response was obtained (connection refused, DNS failure,
 * timeout).
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse get(const std::string &url, std::chrono::milliseconds timeout) = 0;

  virtual HttpResponse post_json(const std::string &url, const std::string &body,
                                 std::chrono::milliseconds timeout) = 0;
};

class CurlHttpTransport : public HttpTransport {
 public:
  CurlHttpTransport();
  ~CurlHttpTransport() override;

  CurlHttpTransport(const CurlHttpTransport &) = delete;
  CurlHttpTransport &operator=(const CurlHttpTransport &) = delete;

  HttpResponse get(const std::string &url, std::chrono::milliseconds timeout) override;

  HttpResponse post_json(const std::string &url, const std::string &body,
                         std::chrono::milliseconds timeout) override;

 private:
  HttpResponse perform(const std::string &url, const std::string *body, std::chrono::milliseconds timeout);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace smartscan_core
