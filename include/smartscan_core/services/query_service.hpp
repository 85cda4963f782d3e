#pragma once

#include <memory>
#include <string>
#include <vector>

#include "smartscan_core/async/cancellation_token.hpp"
#include "smartscan_core/llm/llm_client.hpp"
#include "smartscan_core/vector_store.hpp"

namespace smartscan_core {

class QueryService {
 public:
  // Returned without any network call when nothing has been indexed
  static constexpr const char *kNoDocumentsMessage =
      "No documents have been indexed yet. Please index your documents first.";
  // Returned when the generation response carried no text
  static constexpr const char *kNoResponseMessage = "No response received.";

  QueryService(std::shared_ptr<VectorStore> vector_store,
               std::shared_ptr<EmbeddingClient> embedding_client,
               std::shared_ptr<GenerationClient> generation_client);

  // Grounded answer to `question` from the top_k most similar chunks
  std::string answer(const std::string &question, const std::string &llm_model,
                     const std::string &embedding_model, int top_k = 3,
                     const async::CancellationToken &cancel = {});

  // Top-k chunks for `question` without generation; empty when nothing is indexed
  std::vector<SearchResult> retrieve(const std::string &question, const std::string &embedding_model,
                                     int top_k = 3, const async::CancellationToken &cancel = {});

  // Instruction, attributed context in result order, then the question
  static std::string build_prompt(const std::string &question, const std::vector<SearchResult> &context);

 private:
  std::vector<float> embed_query(const std::string &query, const std::string &embedding_model);

  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<GenerationClient> generation_client_;
};

}  // namespace smartscan_core
