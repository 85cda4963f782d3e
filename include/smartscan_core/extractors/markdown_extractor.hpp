#pragma once
#include "content_extractor.hpp"

namespace smartscan_core {

// Markdown is indexed verbatim; headings and markup stay in the chunk text
class MarkdownExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;
};

}  // namespace smartscan_core
