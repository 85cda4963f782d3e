#include "smartscan_core/extractors/content_extractor.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace smartscan_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw ContentExtractorError("Failed reading file: " + file_path.string());
  }
  std::string content = buffer.str();

  if (utf8::starts_with_bom(content.begin(), content.end())) {
    content.erase(0, 3);
  }

  // Request bodies are JSON, which must be valid UTF-8
  if (!utf8::is_valid(content.begin(), content.end())) {
    std::string repaired;
    repaired.reserve(content.size());
    utf8::replace_invalid(content.begin(), content.end(), std::back_inserter(repaired));
    return repaired;
  }
  return content;
}

std::string ContentExtractor::extract_text(const fs::path& file_path) const {
  return get_string_content(file_path);
}

std::vector<std::string> ContentExtractor::get_chunks(const fs::path& file_path,
                                                      const ChunkingOptions& options) const {
  return chunk_text(extract_text(file_path), options);
}

bool ContentExtractor::has_extension(const fs::path& file_path, const std::string& extension) {
  std::string actual = file_path.extension().string();
  if (actual.size() != extension.size()) {
    return false;
  }
  return std::equal(actual.begin(), actual.end(), extension.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}

}  // namespace smartscan_core
