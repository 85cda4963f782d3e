#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "smartscan_core/async/cancellation_token.hpp"
#include "smartscan_core/llm/http_transport.hpp"
#include "smartscan_core/llm/llm_client.hpp"
#include "smartscan_core/llm/retry_policy.hpp"

namespace smartscan_core {

struct OllamaClientOptions {
  // Generation on a local model can take minutes
  std::chrono::milliseconds request_timeout{std::chrono::minutes(5)};
  std::chrono::milliseconds ping_timeout{std::chrono::seconds(5)};
  RetryPolicy retry_policy = RetryPolicy::none();
  // Checked before every attempt and before every backoff sleep
  async::CancellationToken cancel;
};

class OllamaClient : public EmbeddingClient, public GenerationClient {
 public:
  OllamaClient(const std::string &ollama_url, std::shared_ptr<HttpTransport> transport,
               OllamaClientOptions options = {}, Sleeper sleeper = default_sleeper());
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // POST /api/embeddings
  std::vector<float> get_embedding(const std::string &text, const std::string &model) override;

  // POST /api/generate with stream disabled
  std::optional<std::string> generate(const std::string &model, const std::string &prompt) override;

  // GET /api/tags; never throws
  virtual bool is_server_available();

  const std::string &base_url() const {
    return ollama_url_;
  }

 private:
  std::string ollama_url_;
  std::shared_ptr<HttpTransport> transport_;
  OllamaClientOptions options_;
  Sleeper sleeper_;

  // Helper methods
  nlohmann::json post_with_retry(const std::string &endpoint, const nlohmann::json &payload);
  nlohmann::json post_once(const std::string &url, const std::string &body);
  std::string build_url(const std::string &endpoint) const;
};

// Drops trailing slashes so endpoints can be appended with a single '/'
std::string normalize_base_url(const std::string &url);

}  // namespace smartscan_core
