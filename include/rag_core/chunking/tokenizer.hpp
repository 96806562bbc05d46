#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rag_core {

// Token id as produced by a Tokenizer. Ids are only meaningful to the tokenizer that made them.
using Token = int;

class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  virtual std::vector<Token> encode(const std::string &text) const = 0;

  // Lossy: decode(encode(text)) is not required to reproduce text byte for byte
  virtual std::string decode(const std::vector<Token> &tokens) const = 0;
};

// Builds a fresh tokenizer. Chunking asks for one per text so token ids never outlive the call.
using TokenizerFactory = std::function<std::unique_ptr<Tokenizer>()>;

}  // namespace rag_core
