#pragma once

#include "content_extractor.hpp"

namespace smartscan_core {

class PlainTextExtractor : public ContentExtractor {
public:
    bool can_handle(const fs::path& file_path) const override;
};

}  // namespace smartscan_core
