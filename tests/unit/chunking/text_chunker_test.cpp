#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "common/utilities_test.hpp"
#include "smartscan_core/chunking/text_chunker.hpp"
#include "smartscan_core/errors.hpp"

namespace smartscan_core {

namespace {

std::vector<std::string> words_of(const std::string& chunk) {
  std::vector<std::string> words;
  std::istringstream stream(chunk);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

}  // namespace

TEST(TextChunkerTest, EmptyInputYieldsNoChunks) {
  EXPECT_TRUE(chunk_text("").empty());
}

TEST(TextChunkerTest, WhitespaceOnlyInputYieldsNoChunks) {
  EXPECT_TRUE(chunk_text("  \n\t \r\n   ").empty());
}

TEST(TextChunkerTest, ShortTextIsSingleChunk) {
  auto chunks = chunk_text("alpha beta gamma", 200, 20);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "alpha beta gamma");
}

TEST(TextChunkerTest, CollapsesMixedWhitespaceToSingleSpaces) {
  auto chunks = chunk_text("  alpha\t\tbeta\r\n\ngamma  ", 10, 2);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "alpha beta gamma");
}

TEST(TextChunkerTest, WindowsAdvanceByStrideAndOverlap) {
  // 10 words, windows of 4 advancing by 3: [0..3], [3..6], [6..9], [9]
  auto chunks = chunk_text(smartscan_tests::TestUtilities::make_words(10), 4, 1);
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0], "w0 w1 w2 w3");
  EXPECT_EQ(chunks[1], "w3 w4 w5 w6");
  EXPECT_EQ(chunks[2], "w6 w7 w8 w9");
  EXPECT_EQ(chunks[3], "w9");
}

TEST(TextChunkerTest, FinalWindowIsClippedToRemainingWords) {
  auto chunks = chunk_text(smartscan_tests::TestUtilities::make_words(7), 4, 1);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[1], "w3 w4 w5 w6");
  EXPECT_EQ(chunks[2], "w6");

  chunks = chunk_text(smartscan_tests::TestUtilities::make_words(8), 4, 1);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[2], "w6 w7");
}

TEST(TextChunkerTest, ConsecutiveWindowsOverlapByExactlyOverlapWords) {
  const int size = 200;
  const int overlap = 20;
  auto chunks = chunk_text(smartscan_tests::TestUtilities::make_words(1000), size, overlap);
  ASSERT_GT(chunks.size(), 2u);

  for (size_t i = 0; i + 1 < chunks.size(); ++i) {
    auto current = words_of(chunks[i]);
    auto next = words_of(chunks[i + 1]);
    ASSERT_EQ(current.size(), static_cast<size_t>(size));
    std::vector<std::string> tail(current.end() - overlap, current.end());
    std::vector<std::string> head(next.begin(), next.begin() + overlap);
    EXPECT_EQ(tail, head) << "windows " << i << " and " << i + 1;
  }
}

TEST(TextChunkerTest, StrideReconstructionCoversEveryWordOnce) {
  const int size = 7;
  const int overlap = 2;
  const std::string text = smartscan_tests::TestUtilities::make_words(53);
  auto chunks = chunk_text(text, size, overlap);

  // Take the first (size - overlap) words of each window, and the whole last one
  std::vector<std::string> rebuilt;
  for (size_t i = 0; i < chunks.size(); ++i) {
    auto words = words_of(chunks[i]);
    size_t take = (i + 1 < chunks.size()) ? static_cast<size_t>(size - overlap) : words.size();
    rebuilt.insert(rebuilt.end(), words.begin(), words.begin() + take);
  }
  EXPECT_EQ(rebuilt, words_of(text));
}

TEST(TextChunkerTest, TrailingWindowOfOnlyOverlapWordsIsKept) {
  auto chunks = chunk_text(smartscan_tests::TestUtilities::make_words(200));
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(words_of(chunks[0]).size(), 200u);
  auto last = words_of(chunks[1]);
  ASSERT_EQ(last.size(), 20u);
  EXPECT_EQ(last.front(), "w180");
  EXPECT_EQ(last.back(), "w199");

  chunks = chunk_text(smartscan_tests::TestUtilities::make_words(25), 10, 2);
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[2], "w16 w17 w18 w19 w20 w21 w22 w23 w24");
  EXPECT_EQ(chunks[3], "w24");
}

TEST(TextChunkerTest, ZeroOverlapProducesDisjointWindows) {
  auto chunks = chunk_text(smartscan_tests::TestUtilities::make_words(6), 3, 0);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "w0 w1 w2");
  EXPECT_EQ(chunks[1], "w3 w4 w5");
}

TEST(TextChunkerTest, SizeEqualToOverlapIsRejected) {
  EXPECT_THROW(chunk_text("alpha beta", 20, 20), InvalidConfigurationError);
}

TEST(TextChunkerTest, OverlapLargerThanSizeIsRejected) {
  EXPECT_THROW(chunk_text("alpha beta", 10, 20), InvalidConfigurationError);
}

TEST(TextChunkerTest, NegativeOverlapIsRejected) {
  EXPECT_THROW(chunk_text("alpha beta", 10, -1), InvalidConfigurationError);
}

TEST(TextChunkerTest, InvalidParametersRejectedEvenForEmptyText) {
  EXPECT_THROW(chunk_text("", 0, 0), InvalidConfigurationError);
}

TEST(TextChunkerTest, ChunkingOptionsOverloadUsesDefaults) {
  ChunkingOptions options;
  EXPECT_EQ(options.chunk_size_words, 200);
  EXPECT_EQ(options.overlap_words, 20);
  auto chunks = chunk_text(smartscan_tests::TestUtilities::make_words(250), options);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(words_of(chunks[1]).size(), 70u);
}

TEST(TextChunkerTest, IsBlankDetectsWhitespaceOnly) {
  EXPECT_TRUE(is_blank(""));
  EXPECT_TRUE(is_blank(" \t\n"));
  EXPECT_FALSE(is_blank(" a "));
}

}  // namespace smartscan_core
