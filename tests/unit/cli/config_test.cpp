#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>

#include "smartscan_cli/config.hpp"

using smartscan_cli::Config;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/smartscan_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.llm_model, "llama3.2");
  EXPECT_EQ(cfg.documents_folder, "./documents");
  EXPECT_EQ(cfg.top_k, 3);
  EXPECT_EQ(cfg.chunk_size_words, 200);
  EXPECT_EQ(cfg.overlap_words, 20);
  EXPECT_EQ(cfg.request_timeout_seconds, 300);
  EXPECT_EQ(cfg.num_workers, 1);
  EXPECT_EQ(cfg.retry_max_attempts, 1);
  EXPECT_EQ(cfg.retry_initial_backoff_ms, 500);
  EXPECT_FALSE(cfg.strict_dimensions);
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"ollama_url", "http://gpu-box:11434"},
      {"embedding_model", "mxbai-embed-large"},
      {"llm_model", "mistral"},
      {"documents_folder", "/srv/scans"},
      {"top_k", 5},
      {"chunk_size_words", 120},
      {"overlap_words", 10},
      {"num_workers", 4},
      {"strict_dimensions", true}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.ollama_url, "http://gpu-box:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.llm_model, "mistral");
  EXPECT_EQ(cfg.documents_folder, "/srv/scans");
  EXPECT_EQ(cfg.top_k, 5);
  EXPECT_EQ(cfg.chunk_size_words, 120);
  EXPECT_EQ(cfg.overlap_words, 10);
  EXPECT_EQ(cfg.num_workers, 4);
  EXPECT_TRUE(cfg.strict_dimensions);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "ollama_url": "http://localhost:11434",
    "llm_model": "llama3.2",
    "top_k": 2,
    "retry_max_attempts": 3
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (const std::exception&) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.top_k, 2);
  EXPECT_EQ(cfg.retry_max_attempts, 3);
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
}

TEST(ConfigTest, FromFileInvalidPathThrows) {
  EXPECT_THROW(Config::from_file("/path/that/does/not/exist.json"), std::runtime_error);
}

TEST(ConfigTest, FromFileInvalidJsonThrows) {
  std::string path = write_temp_file("{ not json");
  EXPECT_THROW(Config::from_file(path), std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, NonObjectJsonThrows) {
  EXPECT_THROW(Config::from_json(nlohmann::json::array({1, 2})), std::runtime_error);
}

TEST(ConfigTest, WrongValueTypeThrows) {
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"top_k": "three"})")), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"ollama_url": 11434})")), std::runtime_error);
}

TEST(ConfigTest, ValidationRejectsUnusableValues) {
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"ollama_url": ""})")), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"embedding_model": ""})")), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"top_k": 0})")), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"overlap_words": -1})")), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"chunk_size_words": 20, "overlap_words": 20})")), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"request_timeout_seconds": 0})")), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"num_workers": 0})")), std::runtime_error);
  EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"retry_max_attempts": 0})")), std::runtime_error);
}
