#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "rag_core/async/cancellation.hpp"

namespace rag_core {

/**
 * @brief Contract of the external embedding service.
 *
 * One call embeds one batch. Implementations return exactly one vector per
 * input text, in input order, and report failures as EmbeddingServiceError
 * with the transient flag set for timeouts and transport errors.
 *
 * A call must return promptly once the token is cancelled, throwing
 * EmbeddingCancelled instead of waiting out the timeout.
 */
class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  virtual std::vector<std::vector<float>> embed_texts(const std::vector<std::string>& texts,
                                                      std::chrono::milliseconds timeout,
                                                      const async::CancellationToken& token) = 0;

  virtual bool is_server_available() = 0;
};

}  // namespace rag_core
