#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedding_provider.hpp"
#include "rag_core/store/metadata_store.hpp"

namespace rag_core {

class RetrievalStoreError : public std::exception {
 public:
  explicit RetrievalStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The store cannot be built: no embedding provider, no usable dimension, or a non-empty index
class ConfigurationError : public RetrievalStoreError {
 public:
  using RetrievalStoreError::RetrievalStoreError;
};

// The provider returned a different number of embeddings than texts submitted
class EmbeddingMismatchError : public RetrievalStoreError {
 public:
  using RetrievalStoreError::RetrievalStoreError;
};

// An embedding's width differs from the store's dimension
class DimensionMismatchError : public RetrievalStoreError {
 public:
  using RetrievalStoreError::RetrievalStoreError;
};

struct AddDocumentsResult {
  size_t chunks_added;
  size_t total_vectors;
};

struct ChunkSearchResult {
  std::string document_name;
  int chunk_number;
  std::string text;
  float score;  // squared L2 distance, lower is closer
};

/**
 * @class RetrievalStore
 * @brief Embeds chunk batches and keeps the vector index and chunk metadata in lockstep.
 *
 * Every id in the index has a metadata entry and vice versa. A batch is either committed
 * completely or, if any step fails, not at all. Embedding runs outside the lock;
 * only the commit into index and metadata is exclusive, and searches share the lock.
 */
class RetrievalStore {
 public:
  /**
   * @param embedding_provider Source of embeddings for chunks and queries.
   * @param dimension Width every embedding must have.
   * @param index Backend to store vectors in; a FlatL2VectorIndex is created when null.
   * @throws ConfigurationError on a null provider, a zero dimension, or an index that is not
   * empty or has another dimension.
   */
  RetrievalStore(std::shared_ptr<EmbeddingProvider> embedding_provider,
                 size_t dimension,
                 std::unique_ptr<VectorIndex> index = nullptr);
  ~RetrievalStore() = default;

  RetrievalStore(const RetrievalStore &) = delete;
  RetrievalStore &operator=(const RetrievalStore &) = delete;
  RetrievalStore(RetrievalStore &&) = delete;
  RetrievalStore &operator=(RetrievalStore &&) = delete;

  AddDocumentsResult add_documents(const std::vector<std::string> &chunks,
                                   const std::string &document_name);

  std::vector<ChunkSearchResult> search(const std::string &query_text, int k);

  // Returns the vector count afterwards, which is always 0
  size_t reset();

  size_t total_vectors() const;

  size_t dimension() const {
    return dimension_;
  }

 private:
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  size_t dimension_;
  std::unique_ptr<VectorIndex> index_;
  MetadataStore metadata_;
  mutable std::shared_mutex store_mutex_;

  void validate_embedding_dimension(const std::vector<float> &embedding, size_t position) const;
};

}  // namespace rag_core
