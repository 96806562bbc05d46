#pragma once

#include <string>
#include <vector>

#include "rag_core/chunking/tokenizer.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

class TokenChunker {
 public:
  explicit TokenChunker(TokenizerFactory make_tokenizer);

  /**
   * @brief Splits text into overlapping windows of at most chunk_size tokens.
   *
   * Windows advance by chunk_size - chunk_overlap tokens. When the overlap is not smaller than
   * the window the start moves to half a window before the end of the previous window, so the
   * walk always terminates. Blank text yields no chunks.
   *
   * Each call encodes and decodes through its own tokenizer, released before returning.
   *
   * @throws std::invalid_argument if chunk_size is 0
   */
  std::vector<Chunk> chunk(const std::string &text, size_t chunk_size, size_t chunk_overlap) const;

 private:
  TokenizerFactory make_tokenizer_;
};

}  // namespace rag_core
