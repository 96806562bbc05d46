#include "rag_core/services/search_service.hpp"

#include <iostream>
#include <stdexcept>

namespace rag_core {

SearchService::SearchService(std::shared_ptr<RetrievalStore> retrieval_store, int default_top_k)
    : retrieval_store_(std::move(retrieval_store)), default_top_k_(default_top_k) {
  if (default_top_k_ <= 0) {
    throw std::invalid_argument("default_top_k must be greater than 0");
  }
}

std::vector<ChunkSearchResult> SearchService::search(const std::string &query) {
  return search(query, default_top_k_);
}

std::vector<ChunkSearchResult> SearchService::search(const std::string &query, int k) {
  if (query.empty()) {
    throw std::invalid_argument("query cannot be empty");
  }
  std::cout << "Searching for top " << k << " chunks for query: '" << query.substr(0, 50) << "'"
            << std::endl;
  return retrieval_store_->search(query, k);
}

}  // namespace rag_core
