#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rag_core {

using VectorId = int64_t;

struct IndexHit {
  VectorId id;
  float distance;
};

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Exact nearest-neighbour index over fixed-dimension float vectors.
 *
 * Ids are assigned densely in insertion order starting at 0. Implementations are not
 * synchronised; callers serialise mutations against reads.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Adds every vector or none. Returns the ids assigned, in input order, starting at count().
  virtual std::vector<VectorId> add(const std::vector<std::vector<float>> &vectors) = 0;

  // Up to k hits ordered by ascending distance, ties by ascending id
  virtual std::vector<IndexHit> search(const std::vector<float> &query_vector, size_t k) const = 0;

  virtual void reset() = 0;
  virtual size_t count() const = 0;
  virtual size_t dimension() const = 0;
};

}  // namespace rag_core
