#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a given file type.
 *
 * The registered extractors form the indexer's allow-list: a file no extractor
 * can handle is skipped. This class is non-copyable and non-movable.
 */
namespace smartscan_core {
class ContentExtractorFactory {
 public:
  /**
   * @brief Constructs the factory and registers the plain text, markdown and CSV extractors.
   */
  ContentExtractorFactory();

  /**
   * @brief Finds and returns the extractor for the given file.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return A constant reference to the appropriate ContentExtractor.
   * @throw ContentExtractorError if no registered extractor handles the file.
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  /**
   * @brief Whether any registered extractor handles the file's extension.
   */
  bool is_supported(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  const ContentExtractor* find_extractor(const std::filesystem::path& file_path) const;

  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};
}  // namespace smartscan_core
