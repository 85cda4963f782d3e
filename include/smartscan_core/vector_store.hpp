#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <vector>

#include "smartscan_core/types/chunk.hpp"

namespace smartscan_core
{

  struct SearchResult
  {
    Chunk chunk;
    float score;
  };

  // What to do when a vector's length differs from the store's dimensionality
  enum class DimensionPolicy
  {
    Tolerate,  // compare over the shorter length and warn
    Reject     // throw InvalidConfigurationError
  };

  /**
   * Cosine similarity over the first min(|a|, |b|) elements.
   * dot(a, b) / (|a| * |b| + 1e-10), so all-zero vectors score 0 instead of dividing by zero.
   */
  float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

  /**
   * In-memory collection of embedded chunks with brute-force top-k search.
   *
   * Appends and clears take an exclusive lock; searches share it, so an indexing
   * worker pool can append while nothing else is reading.
   */
  class VectorStore
  {
  public:
    explicit VectorStore(DimensionPolicy policy = DimensionPolicy::Tolerate);

    // Disable copy constructor and assignment
    VectorStore(const VectorStore &) = delete;
    VectorStore &operator=(const VectorStore &) = delete;

    void append(Chunk chunk);

    // Idempotent
    void clear();

    size_t size() const;
    bool empty() const;

    // Dimensionality of the first stored chunk, 0 when empty
    size_t dimensions() const;

    // Ranked by descending score, ties in insertion order, at most top_k results
    std::vector<SearchResult> search(const std::vector<float> &query_vector, int top_k) const;

  private:
    DimensionPolicy policy_;
    std::vector<Chunk> chunks_;
    mutable std::shared_mutex mutex_;

    // Helper methods
    void check_dimension(size_t actual, const std::string &what) const;
  };

}  // namespace smartscan_core
