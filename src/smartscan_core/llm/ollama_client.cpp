#include "smartscan_core/llm/ollama_client.hpp"

#include <cmath>
#include <iostream>
#include <limits>

#include "smartscan_core/errors.hpp"

namespace smartscan_core {

namespace {

constexpr size_t kMaxErrorBodyChars = 200;

std::string excerpt(const std::string &body) {
  if (body.size() <= kMaxErrorBodyChars) {
    return body;
  }
  return body.substr(0, kMaxErrorBodyChars) + "...";
}

// Prompts may carry invalid UTF-8 from user input; replace rather than fail the request
std::string to_request_body(const nlohmann::json &payload) {
  return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

std::string normalize_base_url(const std::string &url) {
  std::string normalized = url;
  while (!normalized.empty() && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

OllamaClient::OllamaClient(const std::string &ollama_url, std::shared_ptr<HttpTransport> transport,
                           OllamaClientOptions options, Sleeper sleeper)
    : ollama_url_(normalize_base_url(ollama_url)),
      transport_(std::move(transport)),
      options_(std::move(options)),
      sleeper_(std::move(sleeper)) {
  if (!transport_) {
    throw InvalidConfigurationError("OllamaClient requires an HTTP transport");
  }
  if (ollama_url_.empty()) {
    throw InvalidConfigurationError("Ollama URL cannot be empty");
  }
}

std::string OllamaClient::build_url(const std::string &endpoint) const {
  return ollama_url_ + endpoint;
}

nlohmann::json OllamaClient::post_once(const std::string &url, const std::string &body) {
  HttpResponse response = transport_->post_json(url, body, options_.request_timeout);
  if (!response.is_success()) {
    throw ServiceError(response.status_code, "Ollama returned HTTP " +
                                                 std::to_string(response.status_code) + " for " + url +
                                                 ": " + excerpt(response.body));
  }

  try {
    return nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error &e) {
    throw MalformedResponseError("Response from " + url + " is not valid JSON: " + e.what());
  }
}

nlohmann::json OllamaClient::post_with_retry(const std::string &endpoint, const nlohmann::json &payload) {
  const std::string url = build_url(endpoint);
  const std::string body = to_request_body(payload);

  for (int attempt = 1;; ++attempt) {
    options_.cancel.throw_if_cancelled("Request to " + url + " cancelled");
    try {
      return post_once(url, body);
    } catch (const SmartScanError &e) {
      if (!options_.retry_policy.should_retry(e, attempt)) {
        throw;
      }
      options_.cancel.throw_if_cancelled("Request to " + url + " cancelled after attempt " +
                                         std::to_string(attempt));
      auto delay = options_.retry_policy.backoff_for(attempt);
      std::cerr << "Warning: attempt " << attempt << " to " << url << " failed (" << e.what()
                << "), retrying in " << delay.count() << " ms" << std::endl;
      sleeper_(delay);
    }
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text, const std::string &model) {
  nlohmann::json json_response = post_with_retry("/api/embeddings", {{"model", model}, {"prompt", text}});

  // Check if embedding field exists
  if (!json_response.is_object() || !json_response.contains("embedding")) {
    throw MalformedResponseError("Response does not contain embedding field");
  }

  const auto &embedding = json_response["embedding"];
  if (!embedding.is_array() || embedding.empty()) {
    throw MalformedResponseError("Embedding field is not a non-empty array");
  }

  std::vector<float> values;
  values.reserve(embedding.size());
  for (const auto &value : embedding) {
    if (!value.is_number()) {
      throw MalformedResponseError("Embedding array contains a non-numeric value");
    }
    const double number = value.get<double>();
    if (!std::isfinite(number) || std::fabs(number) > std::numeric_limits<float>::max()) {
      throw MalformedResponseError("Embedding array contains a value outside float range");
    }
    values.push_back(static_cast<float>(number));
  }
  return values;
}

std::optional<std::string> OllamaClient::generate(const std::string &model, const std::string &prompt) {
  nlohmann::json json_response =
      post_with_retry("/api/generate", {{"model", model}, {"prompt", prompt}, {"stream", false}});

  if (!json_response.is_object()) {
    throw MalformedResponseError("Generation response is not a JSON object");
  }

  auto it = json_response.find("response");
  if (it == json_response.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw MalformedResponseError("Generation response field is not a string");
  }
  return it->get<std::string>();
}

bool OllamaClient::is_server_available() {
  try {
    return transport_->get(build_url("/api/tags"), options_.ping_timeout).is_success();
  } catch (const std::exception &e) {
    std::cerr << "Ollama not reachable at " << ollama_url_ << ": " << e.what() << std::endl;
    return false;
  }
}

}  // namespace smartscan_core
