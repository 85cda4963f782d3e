#pragma once

#include <string>
#include <vector>

namespace smartscan_core {

struct Chunk {
  std::vector<float> embedding;
  std::string text;
  // File name of the originating document, used for attribution in answers
  std::string source;
};

}  // namespace smartscan_core
