#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "smartscan_core/types/chunk.hpp"

namespace smartscan_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Fresh, uniquely named directory under the system temp path
  static std::filesystem::path create_temp_dir(const std::string& prefix = "smartscan_test");

  // Writes `content` to `path`, creating parent directories
  static std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content);

  static smartscan_core::Chunk create_test_chunk(const std::string& text, const std::vector<float>& embedding,
                                                 const std::string& source = "test.txt");

  // "w0 w1 w2 ..." with `count` words
  static std::string make_words(int count, const std::string& prefix = "w");
};

/**
 * Base test fixture that provides a temporary documents folder, removed after each test
 */
class TempFolderTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir();
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  std::filesystem::path create_test_file(const std::string& relative_path, const std::string& content) {
    return TestUtilities::write_file(temp_dir_ / relative_path, content);
  }

  std::filesystem::path temp_dir_;
};

}  // namespace smartscan_tests
