#pragma once
#include "content_extractor.hpp"

namespace smartscan_core {

// Rows are indexed as plain text; commas stay attached to the surrounding words
class CsvExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;
};

}  // namespace smartscan_core
