#include "smartscan_core/vector_store.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>

#include "smartscan_core/errors.hpp"

namespace smartscan_core
{

  namespace
  {
    constexpr double kEpsilon = 1e-10;
  }

  float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b)
  {
    if (a.empty() || b.empty())
    {
      return 0.0f;
    }

    const size_t len = std::min(a.size(), b.size());
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < len; ++i)
    {
      dot += static_cast<double>(a[i]) * b[i];
      norm_a += static_cast<double>(a[i]) * a[i];
      norm_b += static_cast<double>(b[i]) * b[i];
    }

    return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b) + kEpsilon));
  }

  VectorStore::VectorStore(DimensionPolicy policy) : policy_(policy) {}

  void VectorStore::check_dimension(size_t actual, const std::string &what) const
  {
    if (chunks_.empty())
    {
      return;
    }
    const size_t expected = chunks_.front().embedding.size();
    if (actual == expected)
    {
      return;
    }

    const std::string message = what + " has " + std::to_string(actual) +
                                " dimensions but the index holds " + std::to_string(expected) +
                                "; was the embedding model changed without re-indexing?";
    if (policy_ == DimensionPolicy::Reject)
    {
      throw InvalidConfigurationError(message);
    }
    std::cerr << "Warning: " << message << std::endl;
  }

  void VectorStore::append(Chunk chunk)
  {
    std::unique_lock lock(mutex_);
    check_dimension(chunk.embedding.size(), "Embedding for '" + chunk.source + "'");
    chunks_.push_back(std::move(chunk));
  }

  void VectorStore::clear()
  {
    std::unique_lock lock(mutex_);
    chunks_.clear();
  }

  size_t VectorStore::size() const
  {
    std::shared_lock lock(mutex_);
    return chunks_.size();
  }

  bool VectorStore::empty() const
  {
    std::shared_lock lock(mutex_);
    return chunks_.empty();
  }

  size_t VectorStore::dimensions() const
  {
    std::shared_lock lock(mutex_);
    return chunks_.empty() ? 0 : chunks_.front().embedding.size();
  }

  std::vector<SearchResult> VectorStore::search(const std::vector<float> &query_vector, int top_k) const
  {
    std::shared_lock lock(mutex_);

    std::vector<SearchResult> results;
    if (top_k <= 0 || chunks_.empty())
    {
      return results;
    }
    check_dimension(query_vector.size(), "Query vector");

    std::vector<std::pair<size_t, float>> scored;
    scored.reserve(chunks_.size());
    for (size_t i = 0; i < chunks_.size(); ++i)
    {
      scored.emplace_back(i, cosine_similarity(query_vector, chunks_[i].embedding));
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto &lhs, const auto &rhs) { return lhs.second > rhs.second; });

    const size_t limit = std::min(scored.size(), static_cast<size_t>(top_k));
    results.reserve(limit);
    for (size_t i = 0; i < limit; ++i)
    {
      results.push_back({chunks_[scored[i].first], scored[i].second});
    }
    return results;
  }

} // namespace smartscan_core
