#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "rag_core/index/vector_index.hpp"

namespace rag_core {

class MetadataStoreError : public std::exception {
 public:
  explicit MetadataStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ChunkMetadata {
  VectorId id;
  std::string document_name;
  int chunk_number;
  std::string text;
};

/**
 * @class MetadataStore
 * @brief In-memory record of where each indexed chunk came from.
 *
 * Entries are kept in an array addressed by vector id, mirroring the vector index, so ids must
 * be added densely in increasing order. Also owns the per-document chunk counters, which keep
 * counting across repeated uploads of the same document name until reset().
 *
 * A batch goes in three steps. prepare() builds the entries without changing anything,
 * make_room() does every allocation the batch needs, and commit() can then no longer fail.
 *
 * Not synchronised: the owning RetrievalStore serialises access.
 */
class MetadataStore {
 public:
  MetadataStore() = default;

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  /**
   * @brief Builds the entries for texts stored under ids first_id, first_id + 1, ...
   *
   * Chunk numbers continue from the document's counter. Nothing is recorded.
   *
   * @throws MetadataStoreError if first_id would overwrite an entry or leave a gap
   */
  std::vector<ChunkMetadata> prepare(VectorId first_id,
                                     const std::string &document_name,
                                     const std::vector<std::string> &texts) const;

  // Allocates room for `count` more entries and the document's counter
  void make_room(const std::string &document_name, size_t count);

  // Appends a prepared batch. Requires a matching make_room() call since the last change.
  void commit(std::vector<ChunkMetadata> &&batch) noexcept;

  int next_chunk_number(const std::string &document_name) const;

  std::optional<ChunkMetadata> get(VectorId id) const;

  size_t size() const {
    return entries_.size();
  }

  size_t capacity() const {
    return entries_.capacity();
  }

  void reset();

 private:
  std::vector<ChunkMetadata> entries_;
  std::unordered_map<std::string, int> next_chunk_number_;
};

}  // namespace rag_core
