#pragma once

#include <string>
#include <vector>

namespace rag_core {

// Anything that turns text into fixed-width float vectors
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // One row per input text, in input order
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) = 0;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;
};

}  // namespace rag_core
