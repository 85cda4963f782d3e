#include "smartscan_core/extractors/content_extractor_factory.hpp"
#include "smartscan_core/extractors/csv_extractor.hpp"
#include "smartscan_core/extractors/markdown_extractor.hpp"
#include "smartscan_core/extractors/plaintext_extractor.hpp"

namespace smartscan_core {
ContentExtractorFactory::ContentExtractorFactory() {
    extractors.push_back(std::make_unique<PlainTextExtractor>());
    extractors.push_back(std::make_unique<MarkdownExtractor>());
    extractors.push_back(std::make_unique<CsvExtractor>());
}

const ContentExtractor* ContentExtractorFactory::find_extractor(
    const std::filesystem::path& file_path) const {
    for (const auto& extractor : extractors) {
        if (extractor->can_handle(file_path)) {
            return extractor.get();
        }
    }
    return nullptr;
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
    const ContentExtractor* extractor = find_extractor(file_path);
    if (extractor == nullptr) {
        throw ContentExtractorError("No suitable content extractor found for " +
                                    file_path.string());
    }
    return *extractor;
}

bool ContentExtractorFactory::is_supported(const std::filesystem::path& file_path) const {
    return find_extractor(file_path) != nullptr;
}
}  // namespace smartscan_core
