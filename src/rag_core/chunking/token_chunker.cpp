#include "rag_core/chunking/token_chunker.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "rag_core/chunking/text_utils.hpp"

namespace rag_core {

TokenChunker::TokenChunker(TokenizerFactory make_tokenizer)
    : make_tokenizer_(std::move(make_tokenizer)) {
  if (!make_tokenizer_) {
    throw std::invalid_argument("TokenChunker requires a tokenizer factory");
  }
}

std::vector<Chunk> TokenChunker::chunk(const std::string &text,
                                       size_t chunk_size,
                                       size_t chunk_overlap) const {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }

  std::vector<Chunk> chunks;
  if (is_blank(text)) {
    return chunks;
  }

  std::unique_ptr<Tokenizer> tokenizer = make_tokenizer_();
  if (!tokenizer) {
    throw std::invalid_argument("Tokenizer factory returned no tokenizer");
  }

  const std::vector<Token> tokens = tokenizer->encode(text);
  if (tokens.empty()) {
    return chunks;
  }

  const bool has_stride = chunk_overlap < chunk_size;
  if (!has_stride && tokens.size() > chunk_size) {
    std::cerr << "Warning: chunk_overlap (" << chunk_overlap << ") is not smaller than chunk_size ("
              << chunk_size << "). Advancing by half a window instead." << std::endl;
  }

  size_t start = 0;
  while (start < tokens.size()) {
    const size_t end = std::min(start + chunk_size, tokens.size());
    std::vector<Token> window(tokens.begin() + start, tokens.begin() + end);
    chunks.push_back({.content = tokenizer->decode(window), .token_count = window.size()});

    if (end == tokens.size()) {
      break;
    }

    size_t next = has_stride ? start + (chunk_size - chunk_overlap) : end - chunk_size / 2;
    if (next <= start) {
      // No progress possible, resume right after this window
      next = end;
    }
    start = next;
  }

  return chunks;
}

}  // namespace rag_core
