#pragma once

#include <string>
#include <vector>

namespace smartscan_core {

struct ChunkingOptions {
  int chunk_size_words = 200;
  int overlap_words = 20;
};

/**
 * @brief Throws InvalidConfigurationError unless chunk_size_words > overlap_words >= 0.
 */
void validate_chunking_options(int chunk_size_words, int overlap_words);

/**
 * @brief Splits text into overlapping fixed-size word windows.
 *
 * Words are whitespace separated. Each window holds chunk_size_words words joined by a
 * single space and starts chunk_size_words - overlap_words words after the previous one.
 * Windows keep starting until a start falls past the last word, so the last window may be
 * shorter and may hold only words already covered by the previous one. Whitespace-only
 * input produces no chunks.
 *
 * @throw InvalidConfigurationError if the parameters would never advance the window.
 */
std::vector<std::string> chunk_text(const std::string& text, int chunk_size_words = 200,
                                    int overlap_words = 20);

inline std::vector<std::string> chunk_text(const std::string& text, const ChunkingOptions& options) {
  return chunk_text(text, options.chunk_size_words, options.overlap_words);
}

// True if the string holds nothing but whitespace
bool is_blank(const std::string& text);

}  // namespace smartscan_core
