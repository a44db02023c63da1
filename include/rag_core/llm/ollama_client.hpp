#pragma once

#include <string>

#include "rag_core/llm/embedding_client.hpp"

namespace rag_core {

class OllamaClient : public EmbeddingClient {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Posts the whole batch to the embed endpoint in a single request. The
  // request runs on its own thread; a cancelled call abandons it and returns.
  std::vector<std::vector<float>> embed_texts(const std::vector<std::string> &texts,
                                              std::chrono::milliseconds timeout,
                                              const async::CancellationToken &token) override;

  bool is_server_available() override;

  const std::string &get_embedding_model() const {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
};

}  // namespace rag_core
