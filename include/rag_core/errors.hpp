#pragma once

#include <exception>
#include <string>

namespace rag_core {

class RagError : public std::exception {
 public:
  explicit RagError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Invalid or inconsistent configuration. Raised at startup, never mid-run.
class ConfigurationError : public RagError {
 public:
  using RagError::RagError;
};

// A single source document could not be read or decoded
class DocumentLoadError : public RagError {
 public:
  using RagError::RagError;
};

// A call to the embedding service failed. Transient failures (timeouts,
// transport errors) are worth retrying; permanent ones (malformed response,
// wrong vector count or dimension) are not.
class EmbeddingServiceError : public RagError {
 public:
  EmbeddingServiceError(const std::string& message, bool transient)
      : RagError(message), transient_(transient) {}
  bool is_transient() const {
    return transient_;
  }

 private:
  bool transient_;
};

// The caller's token was cancelled while a service call was in flight
class EmbeddingCancelled : public EmbeddingServiceError {
 public:
  explicit EmbeddingCancelled(const std::string& message) : EmbeddingServiceError(message, false) {}
};

// Materializing or publishing a corpus version failed; the previously
// published version stays active.
class IndexPublishError : public RagError {
 public:
  using RagError::RagError;
};

// A stored artifact (payload shard, chunk-detail map, manifest) is malformed
class CorpusDataError : public RagError {
 public:
  using RagError::RagError;
};

class RepositoryError : public RagError {
 public:
  using RagError::RagError;
};

class VectorSearchError : public RagError {
 public:
  VectorSearchError(const std::string& message, bool transient)
      : RagError(message), transient_(transient) {}
  bool is_transient() const {
    return transient_;
  }

 private:
  bool transient_;
};

// Query-time failure surfaced to the caller of Retriever::retrieve
class RetrievalError : public RagError {
 public:
  using RagError::RagError;
};

class RetrievalCancelled : public RetrievalError {
 public:
  using RetrievalError::RetrievalError;
};

}  // namespace rag_core
