#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/store/retrieval_store.hpp"

namespace rag_core {

class SearchService {
 public:
  SearchService(std::shared_ptr<RetrievalStore> retrieval_store, int default_top_k = 5);

  virtual ~SearchService() = default;

  // Natural-language semantic search over every stored chunk, closest first
  virtual std::vector<ChunkSearchResult> search(const std::string &query);
  virtual std::vector<ChunkSearchResult> search(const std::string &query, int k);

  int default_top_k() const {
    return default_top_k_;
  }

 private:
  std::shared_ptr<RetrievalStore> retrieval_store_;
  int default_top_k_;
};

}  // namespace rag_core
