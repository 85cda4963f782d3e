#pragma once

#include <optional>
#include <string>
#include <vector>

namespace smartscan_core {

/**
 * @class EmbeddingClient
 * @brief Turns a span of text into an embedding vector using a named model.
 *
 * One call is one request; implementations throw TransportError, ServiceError or
 * MalformedResponseError on failure.
 */
class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  virtual std::vector<float> get_embedding(const std::string &text, const std::string &model) = 0;
};

/**
 * @class GenerationClient
 * @brief Single non-streaming text generation call.
 *
 * Returns std::nullopt when the service answered successfully but carried no text.
 */
class GenerationClient {
 public:
  virtual ~GenerationClient() = default;

  virtual std::optional<std::string> generate(const std::string &model, const std::string &prompt) = 0;
};

}  // namespace smartscan_core
