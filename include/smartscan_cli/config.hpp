#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace smartscan_cli {

class Config {
 public:
  std::string ollama_url;
  std::string embedding_model;
  std::string llm_model;
  std::string documents_folder;
  int top_k;

  // Chunking configuration
  int chunk_size_words;
  int overlap_words;

  // Request handling
  int request_timeout_seconds;
  int num_workers;
  int retry_max_attempts;
  int retry_initial_backoff_ms;

  // Reject embeddings whose dimensionality differs from the index instead of truncating
  bool strict_dimensions;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
      config.llm_model = json_config.value("llm_model", std::string("llama3.2"));
      config.documents_folder = json_config.value("documents_folder", std::string("./documents"));
      config.top_k = json_config.value("top_k", 3);

      config.chunk_size_words = json_config.value("chunk_size_words", 200);
      config.overlap_words = json_config.value("overlap_words", 20);

      config.request_timeout_seconds = json_config.value("request_timeout_seconds", 300);
      config.num_workers = json_config.value("num_workers", 1);
      config.retry_max_attempts = json_config.value("retry_max_attempts", 1);
      config.retry_initial_backoff_ms = json_config.value("retry_initial_backoff_ms", 500);

      config.strict_dimensions = json_config.value("strict_dimensions", false);
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Config value has the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

  // Defaults for every key
  static Config defaults() {
    return from_json(nlohmann::json::object());
  }

  void validate() const {
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (llm_model.empty()) {
      throw std::runtime_error("llm_model cannot be empty");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (overlap_words < 0) {
      throw std::runtime_error("overlap_words cannot be negative");
    }
    if (chunk_size_words <= overlap_words) {
      throw std::runtime_error("chunk_size_words must be greater than overlap_words");
    }
    if (request_timeout_seconds <= 0) {
      throw std::runtime_error("request_timeout_seconds must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (retry_max_attempts < 1) {
      throw std::runtime_error("retry_max_attempts must be at least 1");
    }
    if (retry_initial_backoff_ms < 0) {
      throw std::runtime_error("retry_initial_backoff_ms cannot be negative");
    }
  }
};

}  // namespace smartscan_cli
