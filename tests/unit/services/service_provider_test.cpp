#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>

#include "rag_core/chunking/token_chunker.hpp"
#include "rag_core/services/ingestion_service.hpp"
#include "rag_core/services/search_service.hpp"
#include "rag_core/services/service_provider.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace rag_tests {

using namespace rag_core;
using ::testing::NiceMock;

class ServiceProviderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    chunker_ = std::make_shared<TokenChunker>(TestUtilities::word_tokenizer_factory());
    mock_provider_ = std::make_shared<NiceMock<MockEmbeddingProvider>>(8);
    store_ = std::make_shared<RetrievalStore>(mock_provider_, 8);
    ingestion_service_ =
        std::make_shared<IngestionService>(store_, chunker_);
    search_service_ = std::make_shared<SearchService>(store_);
  }

  std::shared_ptr<TokenChunker> chunker_;
  std::shared_ptr<NiceMock<MockEmbeddingProvider>> mock_provider_;
  std::shared_ptr<RetrievalStore> store_;
  std::shared_ptr<IngestionService> ingestion_service_;
  std::shared_ptr<SearchService> search_service_;
};

TEST_F(ServiceProviderTest, Getters_ReturnTheSharedInstances) {
  // Act
  ServiceProvider provider(chunker_, mock_provider_, store_, ingestion_service_, search_service_);

  // Assert
  EXPECT_EQ(&provider.get_chunker(), chunker_.get());
  EXPECT_EQ(&provider.get_embedding_provider(), mock_provider_.get());
  EXPECT_EQ(&provider.get_retrieval_store(), store_.get());
  EXPECT_EQ(&provider.get_ingestion_service(), ingestion_service_.get());
  EXPECT_EQ(&provider.get_search_service(), search_service_.get());
}

TEST_F(ServiceProviderTest, Services_ShareOneStore) {
  ServiceProvider provider(chunker_, mock_provider_, store_, ingestion_service_, search_service_);

  provider.get_ingestion_service().ingest_text("a.txt", "one two three");

  EXPECT_EQ(provider.get_retrieval_store().total_vectors(), 1u);
  EXPECT_EQ(provider.get_search_service().search("one").size(), 1u);
}

TEST_F(ServiceProviderTest, Provider_KeepsComponentsAliveAfterCallerReleasesThem) {
  auto provider = std::make_unique<ServiceProvider>(chunker_, mock_provider_, store_,
                                                    ingestion_service_, search_service_);
  RetrievalStore* raw_store = store_.get();

  chunker_.reset();
  store_.reset();
  ingestion_service_.reset();
  search_service_.reset();

  EXPECT_EQ(&provider->get_retrieval_store(), raw_store);
  EXPECT_EQ(provider->get_retrieval_store().total_vectors(), 0u);
}

}  // namespace rag_tests
