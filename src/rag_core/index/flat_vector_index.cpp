#include "rag_core/index/flat_vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <numeric>

namespace rag_core {

namespace {

size_t checked_dimension(size_t dimension) {
  if (dimension == 0) {
    throw VectorIndexError("Vector index dimension must be greater than 0");
  }
  return dimension;
}

}  // namespace

FlatL2VectorIndex::FlatL2VectorIndex(size_t dimension)
    : dimension_(checked_dimension(dimension)),
      faiss_index_(static_cast<faiss::idx_t>(dimension)) {}

void FlatL2VectorIndex::validate_vector_dimension(const std::vector<float> &vector,
                                                  const std::string &what) const {
  if (vector.size() != dimension_) {
    throw VectorIndexError(what + " dimension mismatch. Expected " + std::to_string(dimension_) +
                           ", got " + std::to_string(vector.size()));
  }
}

std::vector<VectorId> FlatL2VectorIndex::add(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    return {};
  }

  // Validate the whole batch before touching the index
  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(vectors.size() * dimension_);
  for (const auto &vector : vectors) {
    validate_vector_dimension(vector, "Vector");
    all_vectors_flat.insert(all_vectors_flat.end(), vector.begin(), vector.end());
  }

  const VectorId first_id = static_cast<VectorId>(faiss_index_.ntotal);
  try {
    faiss_index_.add(static_cast<faiss::idx_t>(vectors.size()), all_vectors_flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to add vectors to Faiss index: " + std::string(e.what()));
  }

  std::vector<VectorId> ids(vectors.size());
  std::iota(ids.begin(), ids.end(), first_id);
  return ids;
}

std::vector<IndexHit> FlatL2VectorIndex::search(const std::vector<float> &query_vector,
                                                size_t k) const {
  validate_vector_dimension(query_vector, "Query vector");

  const size_t total = count();
  const size_t actual_k = std::min(k, total);
  if (actual_k == 0) {
    return {};
  }

  // Score every stored row, then rank. faiss' own knn search doesn't promise an order for
  // equal distances, so ranking is done here to break ties by id.
  std::vector<float> distances(total);
  faiss::fvec_L2sqr_ny(distances.data(), query_vector.data(), faiss_index_.get_xb(), dimension_,
                       total);

  std::vector<VectorId> order(total);
  std::iota(order.begin(), order.end(), 0);
  std::partial_sort(order.begin(), order.begin() + actual_k, order.end(),
                    [&distances](VectorId a, VectorId b) {
                      if (distances[a] != distances[b]) {
                        return distances[a] < distances[b];
                      }
                      return a < b;
                    });

  std::vector<IndexHit> hits;
  hits.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    hits.push_back({order[i], distances[order[i]]});
  }
  return hits;
}

void FlatL2VectorIndex::reset() {
  faiss_index_.reset();
}

size_t FlatL2VectorIndex::count() const {
  return static_cast<size_t>(faiss_index_.ntotal);
}

}  // namespace rag_core
