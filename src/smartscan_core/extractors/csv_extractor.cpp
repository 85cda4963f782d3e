#include "smartscan_core/extractors/csv_extractor.hpp"

namespace smartscan_core {
bool CsvExtractor::can_handle(const std::filesystem::path& file_path) const {
  return has_extension(file_path, ".csv");
}
}  // namespace smartscan_core
