#include "rag_core/store/metadata_store.hpp"

#include <algorithm>

namespace rag_core {

std::vector<ChunkMetadata> MetadataStore::prepare(VectorId first_id,
                                                  const std::string &document_name,
                                                  const std::vector<std::string> &texts) const {
  const auto expected_id = static_cast<VectorId>(entries_.size());
  if (first_id < expected_id) {
    throw MetadataStoreError("Chunk metadata for id " + std::to_string(first_id) +
                             " already exists and cannot be overwritten");
  }
  if (first_id > expected_id) {
    throw MetadataStoreError("Chunk metadata ids must be contiguous. Expected " +
                             std::to_string(expected_id) + ", got " + std::to_string(first_id));
  }

  int chunk_number = next_chunk_number(document_name);
  std::vector<ChunkMetadata> batch;
  batch.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    batch.push_back({first_id + static_cast<VectorId>(i), document_name, chunk_number++, texts[i]});
  }
  return batch;
}

void MetadataStore::make_room(const std::string &document_name, size_t count) {
  size_t needed = entries_.size() + count;
  if (needed > entries_.capacity()) {
    entries_.reserve(std::max(needed, 2 * entries_.capacity()));
  }
  next_chunk_number_.try_emplace(document_name, 0);
}

void MetadataStore::commit(std::vector<ChunkMetadata> &&batch) noexcept {
  if (batch.empty()) {
    return;
  }
  auto counter = next_chunk_number_.find(batch.front().document_name);
  counter->second = batch.back().chunk_number + 1;
  for (auto &entry : batch) {
    entries_.push_back(std::move(entry));
  }
}

int MetadataStore::next_chunk_number(const std::string &document_name) const {
  auto it = next_chunk_number_.find(document_name);
  return it == next_chunk_number_.end() ? 0 : it->second;
}

std::optional<ChunkMetadata> MetadataStore::get(VectorId id) const {
  if (id < 0 || static_cast<size_t>(id) >= entries_.size()) {
    return std::nullopt;
  }
  return entries_[static_cast<size_t>(id)];
}

void MetadataStore::reset() {
  entries_.clear();
  next_chunk_number_.clear();
}

}  // namespace rag_core
