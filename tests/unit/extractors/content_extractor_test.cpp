#include <gtest/gtest.h>

#include <string>

#include "common/utilities_test.hpp"
#include "smartscan_core/extractors/csv_extractor.hpp"
#include "smartscan_core/extractors/markdown_extractor.hpp"
#include "smartscan_core/extractors/plaintext_extractor.hpp"

namespace smartscan_core {

class ContentExtractorTest : public smartscan_tests::TempFolderTestBase {
 protected:
  PlainTextExtractor text_extractor_;
  MarkdownExtractor markdown_extractor_;
  CsvExtractor csv_extractor_;
};

TEST_F(ContentExtractorTest, ReadsWholeFileVerbatim) {
  auto path = create_test_file("notes.txt", "line one\nline two\n");
  EXPECT_EQ(text_extractor_.extract_text(path), "line one\nline two\n");
}

TEST_F(ContentExtractorTest, StripsUtf8ByteOrderMark) {
  auto path = create_test_file("bom.txt", "\xEF\xBB\xBFhello world");
  EXPECT_EQ(text_extractor_.extract_text(path), "hello world");
}

TEST_F(ContentExtractorTest, KeepsValidMultibyteText) {
  auto path = create_test_file("accents.md", "caf\xC3\xA9 na\xC3\xAFve");
  EXPECT_EQ(markdown_extractor_.extract_text(path), "caf\xC3\xA9 na\xC3\xAFve");
}

TEST_F(ContentExtractorTest, ReplacesInvalidUtf8Sequences) {
  auto path = create_test_file("latin1.txt", "caf\xE9 au lait");
  std::string text = text_extractor_.extract_text(path);
  EXPECT_NE(text.find("caf"), std::string::npos);
  EXPECT_NE(text.find("au lait"), std::string::npos);
  // U+FFFD replacement character
  EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(ContentExtractorTest, MissingFileThrows) {
  EXPECT_THROW(text_extractor_.extract_text(temp_dir_ / "missing.txt"), ContentExtractorError);
}

TEST_F(ContentExtractorTest, GetChunksAppliesWordWindows) {
  auto path = create_test_file("rows.csv", "id,name\n1,alpha\n2,beta\n3,gamma\n");
  auto chunks = csv_extractor_.get_chunks(path, ChunkingOptions{2, 1});
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0], "id,name 1,alpha");
  EXPECT_EQ(chunks[1], "1,alpha 2,beta");
  EXPECT_EQ(chunks[2], "2,beta 3,gamma");
  EXPECT_EQ(chunks[3], "3,gamma");
}

TEST_F(ContentExtractorTest, EmptyFileHasNoChunks) {
  auto path = create_test_file("empty.md", "");
  EXPECT_TRUE(markdown_extractor_.get_chunks(path).empty());
}

TEST_F(ContentExtractorTest, CanHandleOnlyOwnExtension) {
  EXPECT_TRUE(text_extractor_.can_handle("a.txt"));
  EXPECT_FALSE(text_extractor_.can_handle("a.md"));
  EXPECT_TRUE(markdown_extractor_.can_handle("A.MD"));
  EXPECT_FALSE(markdown_extractor_.can_handle("a.markdown"));
  EXPECT_TRUE(csv_extractor_.can_handle("a.Csv"));
  EXPECT_FALSE(csv_extractor_.can_handle("a.tsv"));
}

}  // namespace smartscan_core
