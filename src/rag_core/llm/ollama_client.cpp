#include "rag_core/llm/ollama_client.hpp"

#include "ollama.hpp"
#include "rag_core/errors.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

namespace rag_core {

namespace {

constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{20};

// One connection per call; timeouts apply to this request only
std::vector<std::vector<float>> request_embeddings(const std::string &ollama_url,
                                                   const std::string &embedding_model,
                                                   const std::vector<std::string> &texts,
                                                   std::chrono::milliseconds timeout) {
  try {
    Ollama server(ollama_url);
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        timeout + std::chrono::milliseconds(999));
    const int timeout_seconds = std::max<int>(1, static_cast<int>(seconds.count()));
    server.setReadTimeout(timeout_seconds);
    server.setWriteTimeout(timeout_seconds);

    ollama::request request = ollama::request::from_embedding(embedding_model, texts.front());
    request["input"] = texts;

    ollama::response response = server.generate_embeddings(request);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingServiceError("Response does not contain embeddings field", false);
    }
    const auto &embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingServiceError("Embeddings field is not an array", false);
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(embeddings.size());
    for (const auto &embedding : embeddings) {
      if (!embedding.is_array()) {
        throw EmbeddingServiceError("Embedding entry is not an array of floats", false);
      }
      vectors.push_back(embedding.get<std::vector<float>>());
    }
    return vectors;

  } catch (const ollama::exception &e) {
    throw EmbeddingServiceError("Embedding request failed: " + std::string(e.what()), true);
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingServiceError("Malformed embedding response: " + std::string(e.what()), false);
  }
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {}

std::vector<std::vector<float>> OllamaClient::embed_texts(const std::vector<std::string> &texts,
                                                          std::chrono::milliseconds timeout,
                                                          const async::CancellationToken &token) {
  if (texts.empty()) {
    return {};
  }
  if (token.is_cancelled()) {
    throw EmbeddingCancelled("Embedding request cancelled before it was sent");
  }

  // The request thread owns copies of everything it touches, so an abandoned
  // request can finish after this call has returned.
  auto result = std::make_shared<std::promise<std::vector<std::vector<float>>>>();
  std::future<std::vector<std::vector<float>>> future = result->get_future();
  std::thread([result, url = ollama_url_, model = embedding_model_, texts, timeout]() {
    try {
      result->set_value(request_embeddings(url, model, texts, timeout));
    } catch (...) {
      result->set_exception(std::current_exception());
    }
  }).detach();

  while (future.wait_for(CANCEL_POLL_INTERVAL) != std::future_status::ready) {
    if (token.is_cancelled()) {
      std::cout << "[OllamaClient] Embedding request cancelled; abandoning it" << std::endl;
      throw EmbeddingCancelled("Embedding request cancelled while in flight");
    }
  }
  return future.get();
}

bool OllamaClient::is_server_available() {
  Ollama server(ollama_url_);
  return server.is_running();
}

}  // namespace rag_core
