#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "smartscan_core/async/cancellation_token.hpp"
#include "smartscan_core/async/worker_pool.hpp"
#include "smartscan_core/chunking/text_chunker.hpp"
#include "smartscan_core/extractors/content_extractor_factory.hpp"
#include "smartscan_core/llm/llm_client.hpp"
#include "smartscan_core/vector_store.hpp"

namespace smartscan_core {

// Fire-and-forget, human readable progress notifications
using ProgressCallback = std::function<void(const std::string&)>;

struct IndexerOptions {
  ChunkingOptions chunking;

  // Concurrent embedding requests per file; 1 keeps chunks in chunker order
  size_t num_workers = 1;
};

/**
 * @class DocumentIndexer
 * @brief Rebuilds a VectorStore from the supported documents under a folder.
 */
class DocumentIndexer {
 public:
  DocumentIndexer(std::shared_ptr<VectorStore> vector_store,
                  std::shared_ptr<EmbeddingClient> embedding_client,
                  std::shared_ptr<ContentExtractorFactory> extractor_factory,
                  IndexerOptions options = {});

  DocumentIndexer(const DocumentIndexer&) = delete;
  DocumentIndexer& operator=(const DocumentIndexer&) = delete;

  /**
   * @brief Clears the store and indexes every supported file under `folder`.
   *
   * The store is cleared only after the folder has been found. Any failure aborts the
   * run and leaves the chunks appended so far in the store.
   *
   * @return The number of chunks in the store after the run.
   * @throw InvalidConfigurationError for unusable chunking options.
   * @throw NotFoundError if the folder does not exist.
   * @throw CancelledError if `cancel` is triggered.
   */
  int index_documents(const std::filesystem::path& folder, const std::string& embedding_model,
                      const ProgressCallback& progress = {},
                      const async::CancellationToken& cancel = {});

  // Supported files under `folder`, recursively, in lexicographic path order
  std::vector<std::filesystem::path> discover_files(const std::filesystem::path& folder) const;

 private:
  void index_file(const std::filesystem::path& file_path, const std::string& embedding_model,
                  const async::CancellationToken& cancel);
  void embed_sequentially(const std::vector<std::string>& chunks, const std::string& source,
                          const std::string& embedding_model, const async::CancellationToken& cancel);
  void embed_in_pool(const std::vector<std::string>& chunks, const std::string& source,
                     const std::string& embedding_model, const async::CancellationToken& cancel);

  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  IndexerOptions options_;
  std::unique_ptr<async::WorkerPool> worker_pool_;
};

}  // namespace smartscan_core
