#include "smartscan_core/chunking/text_chunker.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "smartscan_core/errors.hpp"

namespace smartscan_core {

namespace {

std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  // operator>> skips every isspace() character, so empty tokens never appear
  while (stream >> word) {
    words.push_back(std::move(word));
  }
  return words;
}

}  // namespace

void validate_chunking_options(int chunk_size_words, int overlap_words) {
  if (overlap_words < 0) {
    throw InvalidConfigurationError("overlap_words must not be negative, got " +
                                    std::to_string(overlap_words));
  }
  if (chunk_size_words <= overlap_words) {
    throw InvalidConfigurationError("chunk_size_words (" + std::to_string(chunk_size_words) +
                                    ") must be greater than overlap_words (" +
                                    std::to_string(overlap_words) + ")");
  }
}

std::vector<std::string> chunk_text(const std::string& text, int chunk_size_words, int overlap_words) {
  validate_chunking_options(chunk_size_words, overlap_words);

  const std::vector<std::string> words = split_words(text);
  std::vector<std::string> chunks;
  if (words.empty()) {
    return chunks;
  }

  const size_t window = static_cast<size_t>(chunk_size_words);
  const size_t stride = static_cast<size_t>(chunk_size_words - overlap_words);

  for (size_t start = 0; start < words.size(); start += stride) {
    const size_t end = std::min(words.size(), start + window);

    std::string chunk = words[start];
    for (size_t i = start + 1; i < end; ++i) {
      chunk += ' ';
      chunk += words[i];
    }
    chunks.push_back(std::move(chunk));
  }

  return chunks;
}

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace smartscan_core
