#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "smartscan_core/chunking/text_chunker.hpp"

namespace fs = std::filesystem;

namespace smartscan_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Full document text as valid UTF-8
  virtual std::string extract_text(const fs::path& file_path) const;

  // opens, reads, and chunks the file
  std::vector<std::string> get_chunks(const fs::path& file_path,
                                      const ChunkingOptions& options = {}) const;

 protected:
  std::string get_string_content(const fs::path& file_path) const;

  // Case-insensitive extension comparison; `extension` includes the leading dot
  static bool has_extension(const fs::path& file_path, const std::string& extension);
};

}  // namespace smartscan_core
