#include "rag_core/store/retrieval_store.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

#include "rag_core/index/flat_vector_index.hpp"

namespace rag_core {

RetrievalStore::RetrievalStore(std::shared_ptr<EmbeddingProvider> embedding_provider,
                               size_t dimension,
                               std::unique_ptr<VectorIndex> index)
    : embedding_provider_(std::move(embedding_provider)),
      dimension_(dimension),
      index_(std::move(index)) {
  if (!embedding_provider_) {
    throw ConfigurationError("RetrievalStore requires an embedding provider");
  }
  if (dimension_ == 0) {
    throw ConfigurationError("Embedding dimension is unknown (0)");
  }
  if (!index_) {
    index_ = std::make_unique<FlatL2VectorIndex>(dimension_);
  } else if (index_->dimension() != dimension_) {
    throw ConfigurationError("Vector index dimension " + std::to_string(index_->dimension()) +
                             " does not match embedding dimension " + std::to_string(dimension_));
  } else if (index_->count() != 0) {
    throw ConfigurationError("Vector index already holds " + std::to_string(index_->count()) +
                             " vectors with no chunk metadata");
  }
  std::cout << "RetrievalStore initialized (dim: " << dimension_ << ")" << std::endl;
}

void RetrievalStore::validate_embedding_dimension(const std::vector<float> &embedding,
                                                  size_t position) const {
  if (embedding.size() != dimension_) {
    throw DimensionMismatchError("Embedding " + std::to_string(position) + " has dimension " +
                                 std::to_string(embedding.size()) + ", expected " +
                                 std::to_string(dimension_));
  }
}

AddDocumentsResult RetrievalStore::add_documents(const std::vector<std::string> &chunks,
                                                 const std::string &document_name) {
  if (chunks.empty()) {
    std::cout << "No chunks provided for document: " << document_name << std::endl;
    return {0, total_vectors()};
  }

  std::cout << "Generating embeddings for " << chunks.size() << " chunks from '" << document_name
            << "'..." << std::endl;
  // Provider failures propagate as-is; nothing has been touched yet
  std::vector<std::vector<float>> embeddings = embedding_provider_->get_embeddings(chunks);

  if (embeddings.size() != chunks.size()) {
    throw EmbeddingMismatchError("Embedding provider returned " +
                                 std::to_string(embeddings.size()) + " embeddings for " +
                                 std::to_string(chunks.size()) + " chunks of '" + document_name +
                                 "'");
  }
  for (size_t i = 0; i < embeddings.size(); ++i) {
    validate_embedding_dimension(embeddings[i], i);
  }

  std::unique_lock<std::shared_mutex> lock(store_mutex_);
  if (index_->count() != metadata_.size()) {
    throw RetrievalStoreError("Vector index holds " + std::to_string(index_->count()) +
                              " vectors but metadata has " + std::to_string(metadata_.size()) +
                              " entries");
  }

  // Everything that can throw happens before the index changes; the commit after it cannot
  std::vector<ChunkMetadata> batch =
      metadata_.prepare(static_cast<VectorId>(index_->count()), document_name, chunks);
  metadata_.make_room(document_name, batch.size());
  index_->add(embeddings);
  metadata_.commit(std::move(batch));

  size_t total = index_->count();
  std::cout << "Added " << chunks.size() << " chunks from '" << document_name
            << "' to RetrievalStore. Total vectors: " << total << std::endl;
  return {chunks.size(), total};
}

std::vector<ChunkSearchResult> RetrievalStore::search(const std::string &query_text, int k) {
  if (k <= 0 || total_vectors() == 0) {
    return {};
  }

  std::vector<float> query_embedding = embedding_provider_->get_embedding(query_text);
  if (query_embedding.size() != dimension_) {
    throw DimensionMismatchError("Query embedding has dimension " +
                                 std::to_string(query_embedding.size()) + ", expected " +
                                 std::to_string(dimension_));
  }

  std::shared_lock<std::shared_mutex> lock(store_mutex_);
  // The store may have been reset while the query was being embedded
  size_t actual_k = std::min(static_cast<size_t>(k), index_->count());
  if (actual_k == 0) {
    return {};
  }

  std::vector<IndexHit> hits = index_->search(query_embedding, actual_k);

  std::vector<ChunkSearchResult> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    std::optional<ChunkMetadata> metadata = metadata_.get(hit.id);
    if (!metadata) {
      std::cerr << "Warning: Index " << hit.id << " found in vector index but not in metadata."
                << std::endl;
      continue;
    }
    results.push_back({std::move(metadata->document_name), metadata->chunk_number,
                       std::move(metadata->text), hit.distance});
  }

  std::cout << "Found " << results.size() << " relevant chunks." << std::endl;
  return results;
}

size_t RetrievalStore::reset() {
  std::unique_lock<std::shared_mutex> lock(store_mutex_);
  index_->reset();
  metadata_.reset();
  std::cout << "RetrievalStore has been reset." << std::endl;
  return index_->count();
}

size_t RetrievalStore::total_vectors() const {
  std::shared_lock<std::shared_mutex> lock(store_mutex_);
  return index_->count();
}

}  // namespace rag_core
