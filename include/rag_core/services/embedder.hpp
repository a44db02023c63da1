#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/async/cancellation.hpp"
#include "rag_core/types.hpp"

namespace rag_core {
class EmbeddingClient;
namespace async {
class WorkerPool;
}
}  // namespace rag_core

namespace rag_core {

struct EmbedderOptions {
  size_t dimension = 768;
  // Largest number of texts the service accepts in one call
  size_t batch_size = 5;
  int max_retries = 3;
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{8000};
  std::chrono::milliseconds request_timeout{30000};
  std::chrono::milliseconds query_timeout{5000};
  std::chrono::milliseconds query_retry_delay{50};
  size_t max_concurrent_requests = 2;
};

// A sub-batch whose inputs could not be embedded
struct BatchFailure {
  size_t batch_number = 0;
  size_t first_index = 0;
  size_t count = 0;
  std::string cause;
};

struct BatchEmbeddingResult {
  // Same length and order as the input; empty where the sub-batch failed
  std::vector<std::optional<std::vector<float>>> vectors;
  std::vector<BatchFailure> failures;
  size_t calls_issued = 0;
  std::vector<Event> events;

  size_t succeeded() const;
};

// Chunks of one failed sub-batch
struct EmbeddingFailure {
  std::vector<std::string> failed_chunk_ids;
  std::string cause;
};

struct ChunkEmbeddingResult {
  // Successfully embedded chunks, in chunk order
  std::vector<EmbeddingRecord> records;
  std::vector<EmbeddingFailure> failures;
  std::vector<Event> events;

  size_t failed_chunk_count() const;
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/**
 * @class Embedder
 * @brief Turns texts into vectors through an EmbeddingClient.
 *
 * Inputs are split into ceil(N / batch_size) ordered sub-batches. Each
 * sub-batch is one service call, retried with exponential backoff on
 * transient errors. A sub-batch that still fails is reported with its
 * inputs and does not affect the others. Sub-batches run concurrently on an
 * internal pool of max_concurrent_requests threads and results are
 * reassembled by position.
 */
class Embedder {
 public:
  /**
   * @param client The embedding service.
   * @param options Batching, retry and timeout settings.
   * @param sleep Used to wait between retries; defaults to sleeping the
   *              calling thread. Must be safe to call from several threads.
   */
  Embedder(std::shared_ptr<EmbeddingClient> client,
           EmbedderOptions options,
           SleepFunction sleep = {});
  ~Embedder();

  Embedder(const Embedder&) = delete;
  Embedder& operator=(const Embedder&) = delete;

  BatchEmbeddingResult embed_batch(const std::vector<std::string>& texts);

  // Embeds chunk texts and pairs each vector with its chunk id and restricts
  ChunkEmbeddingResult embed_chunks(const std::vector<Chunk>& chunks);

  /**
   * @brief Embeds a single query for the interactive path.
   *
   * Uses query_timeout and allows one fast retry on a transient error. The
   * token is handed to the embedding service call.
   *
   * @throw RetrievalCancelled if the token is cancelled before or during a call.
   * @throw RetrievalError if the service fails.
   */
  std::vector<float> embed_query(const std::string& text,
                                 const async::CancellationToken& token = {});

  const EmbedderOptions& options() const {
    return options_;
  }

  // min(initial_backoff * 2^attempt, max_backoff)
  std::chrono::milliseconds backoff_delay(int attempt) const;

 private:
  std::vector<std::vector<float>> call_with_retry(const std::vector<std::string>& batch,
                                                  size_t batch_number,
                                                  std::vector<Event>& events);
  void validate_response(const std::vector<std::vector<float>>& vectors,
                         size_t expected_count) const;

  std::shared_ptr<EmbeddingClient> client_;
  EmbedderOptions options_;
  SleepFunction sleep_;
  std::unique_ptr<async::WorkerPool> pool_;
};

}  // namespace rag_core
