#include "smartscan_core/services/query_service.hpp"

#include <sstream>
#include <stdexcept>

#include "smartscan_core/errors.hpp"

namespace smartscan_core {

QueryService::QueryService(std::shared_ptr<VectorStore> vector_store,
                           std::shared_ptr<EmbeddingClient> embedding_client,
                           std::shared_ptr<GenerationClient> generation_client)
    : vector_store_(std::move(vector_store)),
      embedding_client_(std::move(embedding_client)),
      generation_client_(std::move(generation_client)) {
  if (!vector_store_ || !embedding_client_ || !generation_client_) {
    throw std::invalid_argument("QueryService requires a vector store, embedding client and generation client");
  }
}

std::vector<float> QueryService::embed_query(const std::string &query, const std::string &embedding_model) {
  return embedding_client_->get_embedding(query, embedding_model);
}

std::vector<SearchResult> QueryService::retrieve(const std::string &question,
                                                 const std::string &embedding_model, int top_k,
                                                 const async::CancellationToken &cancel) {
  if (vector_store_->empty()) {
    return {};
  }
  if (top_k < 1) {
    throw InvalidConfigurationError("top_k must be at least 1, got " + std::to_string(top_k));
  }

  cancel.throw_if_cancelled("Query cancelled");
  std::vector<float> query_embedding = embed_query(question, embedding_model);
  return vector_store_->search(query_embedding, top_k);
}

std::string QueryService::answer(const std::string &question, const std::string &llm_model,
                                 const std::string &embedding_model, int top_k,
                                 const async::CancellationToken &cancel) {
  if (vector_store_->empty()) {
    return kNoDocumentsMessage;
  }

  std::vector<SearchResult> context = retrieve(question, embedding_model, top_k, cancel);
  std::string prompt = build_prompt(question, context);

  cancel.throw_if_cancelled("Query cancelled");
  std::optional<std::string> response = generation_client_->generate(llm_model, prompt);
  return response.value_or(kNoResponseMessage);
}

std::string QueryService::build_prompt(const std::string &question,
                                       const std::vector<SearchResult> &context) {
  std::ostringstream prompt;
  prompt << "Use only the following context from scanned documents to answer the question.\n\n";
  prompt << "Context:\n";
  for (const auto &result : context) {
    prompt << "[Source: " << result.chunk.source << "]\n";
    prompt << result.chunk.text << "\n\n";
  }
  prompt << "\nQuestion: " << question << "\n\nAnswer:";
  return prompt.str();
}

}  // namespace smartscan_core
