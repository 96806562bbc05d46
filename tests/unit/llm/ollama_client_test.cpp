#include <gtest/gtest.h>

#include <memory>

#include "rag_core/llm/ollama_client.hpp"

namespace rag_tests {

using namespace rag_core;

TEST(OllamaClientParseTest, ParseEmbeddings_ReadsEveryRow) {
  nlohmann::json response = {
      {"model", "all-minilm"},
      {"embeddings", {{0.1, 0.2, 0.3}, {0.4, 0.5, 0.6}}}
  };

  std::vector<std::vector<float>> rows = OllamaClient::parse_embeddings(response);

  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].size(), 3u);
  EXPECT_FLOAT_EQ(rows[1][2], 0.6f);
}

TEST(OllamaClientParseTest, ParseEmbeddings_EmptyArrayIsNoRows) {
  nlohmann::json response = {{"embeddings", nlohmann::json::array()}};

  EXPECT_TRUE(OllamaClient::parse_embeddings(response).empty());
}

TEST(OllamaClientParseTest, ParseEmbeddings_MissingFieldThrows) {
  nlohmann::json response = {{"error", "model not found"}};

  EXPECT_THROW(OllamaClient::parse_embeddings(response), OllamaError);
}

TEST(OllamaClientParseTest, ParseEmbeddings_NonArrayFieldThrows) {
  nlohmann::json response = {{"embeddings", "oops"}};

  EXPECT_THROW(OllamaClient::parse_embeddings(response), OllamaError);
}

TEST(OllamaClientParseTest, ParseEmbeddings_MalformedRowThrows) {
  nlohmann::json response = {{"embeddings", {{0.1, 0.2}, {"not", "numbers"}}}};

  EXPECT_THROW(OllamaClient::parse_embeddings(response), OllamaError);
}

TEST(OllamaClientTest, Constructor_ThrowsWhenServerUnreachable) {
  EXPECT_THROW(OllamaClient("http://127.0.0.1:1", "all-minilm"), OllamaError);
}

// Runs only when a local Ollama server with the default model is available
TEST(OllamaClientTest, GetEmbeddings_OneRowPerTextWithConsistentWidth) {
  std::unique_ptr<OllamaClient> client;
  size_t dimension = 0;
  try {
    client = std::make_unique<OllamaClient>("http://localhost:11434", "all-minilm");
    dimension = client->probe_dimension();
  } catch (const OllamaError& e) {
    GTEST_SKIP() << "Ollama server not available: " << e.what();
  }

  std::vector<std::vector<float>> rows =
      client->get_embeddings({"The sky is blue.", "Paris is the capital of France.", "fox"});

  ASSERT_EQ(rows.size(), 3u);
  for (const auto& row : rows) {
    EXPECT_EQ(row.size(), dimension);
  }
  EXPECT_EQ(client->get_embedding("single").size(), dimension);
  EXPECT_TRUE(client->get_embeddings({}).empty());
}

}  // namespace rag_tests
