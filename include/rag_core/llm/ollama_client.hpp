#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Embedding provider backed by an Ollama server's /api/embed endpoint.
 *
 * Ollama returns L2-normalised embeddings, so squared L2 distances between them rank the same
 * way cosine similarity would.
 */
class OllamaClient : public EmbeddingProvider {
 public:
  // @throws OllamaError if no server answers at ollama_url
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  // The whole batch goes out as a single request
  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  // Embeds a short probe text and reports the width of the result
  size_t probe_dimension();

  const std::string &embedding_model() const {
    return embedding_model_;
  }

  static std::vector<std::vector<float>> parse_embeddings(const nlohmann::json &json_response);

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
};

}  // namespace rag_core
