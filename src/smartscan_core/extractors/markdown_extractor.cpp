#include "smartscan_core/extractors/markdown_extractor.hpp"

namespace smartscan_core {
bool MarkdownExtractor::can_handle(const std::filesystem::path& file_path) const {
  return has_extension(file_path, ".md");
}
}  // namespace smartscan_core
