#include "rag_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace rag_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<std::vector<float>> OllamaClient::parse_embeddings(const nlohmann::json &json_response) {
  if (!json_response.contains("embeddings")) {
    throw OllamaError("Response does not contain embedding field");
  }

  const auto &embeddings = json_response["embeddings"];
  if (!embeddings.is_array()) {
    throw OllamaError("Embeddings field is not an array");
  }

  std::vector<std::vector<float>> rows;
  rows.reserve(embeddings.size());
  try {
    for (const auto &row : embeddings) {
      rows.push_back(row.get<std::vector<float>>());
    }
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding row: " + std::string(e.what()));
  }
  return rows;
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }

  try {
    // /api/embed accepts an array of inputs and answers with one row per input
    ollama::request request = ollama::request::from_embedding(embedding_model_, texts.front());
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);
    return parse_embeddings(response.as_json());
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    std::vector<std::vector<float>> rows = parse_embeddings(response.as_json());
    if (rows.empty()) {
      throw OllamaError("Response contains no embeddings");
    }
    return std::move(rows.front());
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

size_t OllamaClient::probe_dimension() {
  std::vector<float> probe = get_embedding("dimension probe");
  if (probe.empty()) {
    throw OllamaError("Model " + embedding_model_ + " returned an empty embedding");
  }
  return probe.size();
}

}  // namespace rag_core
