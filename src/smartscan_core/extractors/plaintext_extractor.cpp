#include "smartscan_core/extractors/plaintext_extractor.hpp"

namespace smartscan_core {

bool PlainTextExtractor::can_handle(const std::filesystem::path& file_path) const {
    return has_extension(file_path, ".txt");
}

} // namespace smartscan_core
