#pragma once

#include <memory>

namespace rag_core {
class TokenChunker;
class EmbeddingProvider;
class RetrievalStore;
class IngestionService;
class SearchService;
}

namespace rag_core {

// Built once at startup and handed to whoever needs the shared components
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<TokenChunker> chunker,
                  std::shared_ptr<EmbeddingProvider> embedding_provider,
                  std::shared_ptr<RetrievalStore> store,
                  std::shared_ptr<IngestionService> ingestion,
                  std::shared_ptr<SearchService> search)
      : chunker_(chunker),
        embedding_provider_(embedding_provider),
        store_(store),
        ingestion_service_(ingestion),
        search_service_(search) {}

  // Public getters for each service
  TokenChunker& get_chunker() {
    return *chunker_;
  }
  EmbeddingProvider& get_embedding_provider() {
    return *embedding_provider_;
  }
  RetrievalStore& get_retrieval_store() {
    return *store_;
  }
  IngestionService& get_ingestion_service() {
    return *ingestion_service_;
  }
  SearchService& get_search_service() {
    return *search_service_;
  }

 private:
  std::shared_ptr<TokenChunker> chunker_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<RetrievalStore> store_;
  std::shared_ptr<IngestionService> ingestion_service_;
  std::shared_ptr<SearchService> search_service_;
};

}  // namespace rag_core
