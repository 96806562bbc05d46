#pragma once

#include <faiss/IndexFlat.h>

#include <vector>

#include "rag_core/index/vector_index.hpp"

namespace rag_core {

// Brute-force squared-L2 index. Vectors live contiguously in a faiss IndexFlatL2, so an id is
// simply the row offset of its vector.
class FlatL2VectorIndex : public VectorIndex {
 public:
  explicit FlatL2VectorIndex(size_t dimension);
  ~FlatL2VectorIndex() override = default;

  FlatL2VectorIndex(const FlatL2VectorIndex &) = delete;
  FlatL2VectorIndex &operator=(const FlatL2VectorIndex &) = delete;

  std::vector<VectorId> add(const std::vector<std::vector<float>> &vectors) override;
  std::vector<IndexHit> search(const std::vector<float> &query_vector, size_t k) const override;
  void reset() override;
  size_t count() const override;
  size_t dimension() const override {
    return dimension_;
  }

 private:
  size_t dimension_;
  // mutable because faiss' accessor for the stored vectors is non-const
  mutable faiss::IndexFlatL2 faiss_index_;

  void validate_vector_dimension(const std::vector<float> &vector, const std::string &what) const;
};

}  // namespace rag_core
