#include "smartscan_core/services/document_indexer.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "smartscan_core/errors.hpp"

namespace smartscan_core {

DocumentIndexer::DocumentIndexer(std::shared_ptr<VectorStore> vector_store,
                                 std::shared_ptr<EmbeddingClient> embedding_client,
                                 std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                 IndexerOptions options)
    : vector_store_(std::move(vector_store)),
      embedding_client_(std::move(embedding_client)),
      extractor_factory_(std::move(extractor_factory)),
      options_(options) {
  if (!vector_store_ || !embedding_client_ || !extractor_factory_) {
    throw std::invalid_argument("DocumentIndexer requires a vector store, embedding client and extractor factory");
  }
  if (options_.num_workers == 0) {
    throw InvalidConfigurationError("num_workers must be at least 1");
  }
  if (options_.num_workers > 1) {
    worker_pool_ = std::make_unique<async::WorkerPool>(options_.num_workers);
    worker_pool_->start();
  }
}

std::vector<std::filesystem::path> DocumentIndexer::discover_files(
    const std::filesystem::path& folder) const {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  auto it = std::filesystem::recursive_directory_iterator(
      folder, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw NotFoundError("Cannot read folder " + folder.string() + ": " + ec.message());
  }

  for (const auto& entry : it) {
    if (entry.is_regular_file() && extractor_factory_->is_supported(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

int DocumentIndexer::index_documents(const std::filesystem::path& folder,
                                     const std::string& embedding_model,
                                     const ProgressCallback& progress,
                                     const async::CancellationToken& cancel) {
  validate_chunking_options(options_.chunking.chunk_size_words, options_.chunking.overlap_words);

  if (!std::filesystem::is_directory(folder)) {
    throw NotFoundError("Folder not found: " + folder.string());
  }

  vector_store_->clear();

  const std::vector<std::filesystem::path> files = discover_files(folder);
  for (const auto& file_path : files) {
    cancel.throw_if_cancelled("Indexing cancelled");
    if (progress) {
      progress("Indexing " + file_path.filename().string() + "…");
    }
    index_file(file_path, embedding_model, cancel);
  }

  return static_cast<int>(vector_store_->size());
}

void DocumentIndexer::index_file(const std::filesystem::path& file_path,
                                 const std::string& embedding_model,
                                 const async::CancellationToken& cancel) {
  const ContentExtractor& extractor = extractor_factory_->get_extractor_for(file_path);
  std::vector<std::string> chunks = extractor.get_chunks(file_path, options_.chunking);

  chunks.erase(std::remove_if(chunks.begin(), chunks.end(), is_blank), chunks.end());
  if (chunks.empty()) {
    return;
  }

  const std::string source = file_path.filename().string();
  if (worker_pool_) {
    embed_in_pool(chunks, source, embedding_model, cancel);
  } else {
    embed_sequentially(chunks, source, embedding_model, cancel);
  }
}

void DocumentIndexer::embed_sequentially(const std::vector<std::string>& chunks,
                                         const std::string& source,
                                         const std::string& embedding_model,
                                         const async::CancellationToken& cancel) {
  for (const auto& text : chunks) {
    cancel.throw_if_cancelled("Indexing cancelled");
    std::vector<float> embedding = embedding_client_->get_embedding(text, embedding_model);
    vector_store_->append(Chunk{std::move(embedding), text, source});
  }
}

void DocumentIndexer::embed_in_pool(const std::vector<std::string>& chunks,
                                    const std::string& source,
                                    const std::string& embedding_model,
                                    const async::CancellationToken& cancel) {
  std::vector<async::WorkerPool::Job> jobs;
  jobs.reserve(chunks.size());
  for (const auto& text : chunks) {
    jobs.emplace_back([this, &text, &source, &embedding_model, &cancel]() {
      cancel.throw_if_cancelled("Indexing cancelled");
      std::vector<float> embedding = embedding_client_->get_embedding(text, embedding_model);
      vector_store_->append(Chunk{std::move(embedding), text, source});
    });
  }
  // Blocks until the batch settles, so the captured references outlive every job
  worker_pool_->run_batch(std::move(jobs), cancel);
}

}  // namespace smartscan_core
