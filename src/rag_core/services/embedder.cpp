#include "rag_core/services/embedder.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <thread>

#include "rag_core/async/worker_pool.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/llm/embedding_client.hpp"

namespace rag_core {

namespace {

const char* const kComponent = "Embedder";

struct BatchOutcome {
  std::vector<std::vector<float>> vectors;
  std::optional<std::string> error;
  std::vector<Event> events;
};

}  // namespace

size_t BatchEmbeddingResult::succeeded() const {
  return static_cast<size_t>(std::count_if(vectors.begin(), vectors.end(),
                                           [](const auto& v) { return v.has_value(); }));
}

size_t ChunkEmbeddingResult::failed_chunk_count() const {
  size_t count = 0;
  for (const auto& failure : failures) {
    count += failure.failed_chunk_ids.size();
  }
  return count;
}

Embedder::Embedder(std::shared_ptr<EmbeddingClient> client,
                   EmbedderOptions options,
                   SleepFunction sleep)
    : client_(std::move(client)), options_(options), sleep_(std::move(sleep)) {
  if (!client_) {
    throw ConfigurationError("Embedder requires an embedding client");
  }
  if (options_.batch_size == 0) {
    throw ConfigurationError("embedding.batch_size must be greater than 0");
  }
  if (options_.dimension == 0) {
    throw ConfigurationError("embedding.dimension must be greater than 0");
  }
  if (options_.max_concurrent_requests == 0) {
    throw ConfigurationError("embedding.max_concurrent_requests must be greater than 0");
  }
  if (options_.max_retries < 0) {
    throw ConfigurationError("embedding.max_retries cannot be negative");
  }
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
  if (options_.max_concurrent_requests > 1) {
    pool_ = std::make_unique<async::WorkerPool>(options_.max_concurrent_requests, "EmbedderPool");
  }
}

Embedder::~Embedder() = default;

BatchEmbeddingResult Embedder::embed_batch(const std::vector<std::string>& texts) {
  BatchEmbeddingResult result;
  result.vectors.resize(texts.size());
  if (texts.empty()) {
    return result;
  }

  const size_t batch_size = options_.batch_size;
  const size_t num_batches = (texts.size() + batch_size - 1) / batch_size;
  result.calls_issued = num_batches;

  auto run_batch = [this, &texts, batch_size](size_t batch_index) {
    BatchOutcome outcome;
    const size_t first = batch_index * batch_size;
    const size_t count = std::min(batch_size, texts.size() - first);
    const std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(first),
                                         texts.begin() + static_cast<std::ptrdiff_t>(first + count));
    try {
      outcome.vectors = call_with_retry(batch, batch_index + 1, outcome.events);
    } catch (const std::exception& e) {
      outcome.error = e.what();
    }
    return outcome;
  };

  std::vector<BatchOutcome> outcomes(num_batches);
  if (pool_ && num_batches > 1) {
    std::vector<std::future<BatchOutcome>> futures;
    futures.reserve(num_batches);
    for (size_t b = 0; b < num_batches; ++b) {
      futures.push_back(pool_->submit([&run_batch, b] { return run_batch(b); }));
    }
    for (size_t b = 0; b < num_batches; ++b) {
      outcomes[b] = futures[b].get();
    }
  } else {
    for (size_t b = 0; b < num_batches; ++b) {
      outcomes[b] = run_batch(b);
    }
  }

  for (size_t b = 0; b < num_batches; ++b) {
    BatchOutcome& outcome = outcomes[b];
    result.events.insert(result.events.end(), outcome.events.begin(), outcome.events.end());

    const size_t first = b * batch_size;
    const size_t count = std::min(batch_size, texts.size() - first);
    if (outcome.error) {
      result.failures.push_back(BatchFailure{b + 1, first, count, *outcome.error});
      result.events.push_back(Event{EventLevel::Error, kComponent,
                                    "Batch " + std::to_string(b + 1) + " of " +
                                        std::to_string(num_batches) + " failed (" +
                                        std::to_string(count) + " inputs): " + *outcome.error,
                                    ""});
      continue;
    }
    for (size_t i = 0; i < count; ++i) {
      result.vectors[first + i] = std::move(outcome.vectors[i]);
    }
  }
  return result;
}

ChunkEmbeddingResult Embedder::embed_chunks(const std::vector<Chunk>& chunks) {
  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.text);
  }

  BatchEmbeddingResult batch = embed_batch(texts);

  ChunkEmbeddingResult result;
  result.events = std::move(batch.events);
  result.records.reserve(batch.succeeded());
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (!batch.vectors[i]) {
      continue;
    }
    EmbeddingRecord record;
    record.chunk_id = chunks[i].chunk_id;
    record.vector = std::move(*batch.vectors[i]);
    record.restrict_tags = restricts_for(chunks[i]);
    result.records.push_back(std::move(record));
  }

  for (const auto& failure : batch.failures) {
    EmbeddingFailure chunk_failure;
    chunk_failure.cause = failure.cause;
    for (size_t i = failure.first_index; i < failure.first_index + failure.count; ++i) {
      chunk_failure.failed_chunk_ids.push_back(chunks[i].chunk_id);
    }
    result.failures.push_back(std::move(chunk_failure));
  }
  return result;
}

std::vector<float> Embedder::embed_query(const std::string& text,
                                         const async::CancellationToken& token) {
  if (text.empty()) {
    throw RetrievalError("Query text must not be empty");
  }

  for (int attempt = 0;; ++attempt) {
    if (token.is_cancelled()) {
      throw RetrievalCancelled("Retrieval cancelled before query embedding");
    }
    try {
      std::vector<std::vector<float>> vectors =
          client_->embed_texts({text}, options_.query_timeout, token);
      validate_response(vectors, 1);
      return std::move(vectors.front());
    } catch (const EmbeddingCancelled& e) {
      throw RetrievalCancelled("Retrieval cancelled during query embedding: " + std::string(e.what()));
    } catch (const EmbeddingServiceError& e) {
      if (!e.is_transient() || attempt >= 1) {
        throw RetrievalError("Query embedding failed: " + std::string(e.what()));
      }
      std::cerr << "[Embedder] Query embedding failed, retrying once: " << e.what() << std::endl;
      sleep_(options_.query_retry_delay);
    }
  }
}

std::chrono::milliseconds Embedder::backoff_delay(int attempt) const {
  std::chrono::milliseconds delay = options_.initial_backoff;
  for (int i = 0; i < attempt && delay < options_.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, options_.max_backoff);
}

std::vector<std::vector<float>> Embedder::call_with_retry(const std::vector<std::string>& batch,
                                                          size_t batch_number,
                                                          std::vector<Event>& events) {
  for (int attempt = 0;; ++attempt) {
    try {
      std::vector<std::vector<float>> vectors =
          client_->embed_texts(batch, options_.request_timeout, async::CancellationToken{});
      validate_response(vectors, batch.size());
      return vectors;
    } catch (const EmbeddingServiceError& e) {
      if (!e.is_transient() || attempt >= options_.max_retries) {
        throw;
      }
      const std::chrono::milliseconds delay = backoff_delay(attempt);
      events.push_back(Event{EventLevel::Warning, kComponent,
                             "Batch " + std::to_string(batch_number) + " attempt " +
                                 std::to_string(attempt + 1) + " failed: " + e.what() +
                                 "; retrying in " + std::to_string(delay.count()) + " ms",
                             ""});
      sleep_(delay);
    }
  }
}

void Embedder::validate_response(const std::vector<std::vector<float>>& vectors,
                                 size_t expected_count) const {
  if (vectors.size() != expected_count) {
    throw EmbeddingServiceError("Embedding service returned " + std::to_string(vectors.size()) +
                                    " vectors for " + std::to_string(expected_count) + " inputs",
                                false);
  }
  for (const auto& vector : vectors) {
    if (vector.size() != options_.dimension) {
      throw EmbeddingServiceError("Embedding dimension mismatch. Expected " +
                                      std::to_string(options_.dimension) + ", got " +
                                      std::to_string(vector.size()),
                                  false);
    }
  }
}

}  // namespace rag_core
