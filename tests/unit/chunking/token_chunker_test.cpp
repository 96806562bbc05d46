#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "rag_core/chunking/token_chunker.hpp"
#include "rag_core/chunking/vocabulary_tokenizer.hpp"
#include "../../common/utilities_test.hpp"

namespace rag_tests {

using namespace rag_core;

class TokenChunkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    chunker_ = std::make_unique<TokenChunker>(TestUtilities::word_tokenizer_factory());
  }

  std::vector<std::string> contents(const std::vector<Chunk>& chunks) {
    std::vector<std::string> texts;
    for (const auto& chunk : chunks) {
      texts.push_back(chunk.content);
    }
    return texts;
  }

  std::unique_ptr<TokenChunker> chunker_;
};

TEST_F(TokenChunkerTest, Constructor_RejectsEmptyFactory) {
  EXPECT_THROW(TokenChunker(nullptr), std::invalid_argument);
}

TEST_F(TokenChunkerTest, Chunk_FactoryReturningNothingThrows) {
  TokenChunker chunker([]() { return std::unique_ptr<Tokenizer>(); });

  EXPECT_THROW(chunker.chunk("some text", 4, 1), std::invalid_argument);
}

TEST_F(TokenChunkerTest, Chunk_ZeroChunkSizeThrows) {
  EXPECT_THROW(chunker_->chunk("some text", 0, 0), std::invalid_argument);
}

TEST_F(TokenChunkerTest, Chunk_BlankTextYieldsNoChunks) {
  EXPECT_TRUE(chunker_->chunk("", 4, 1).empty());
  EXPECT_TRUE(chunker_->chunk("  \n\t ", 4, 1).empty());
}

TEST_F(TokenChunkerTest, Chunk_UnicodeWhitespaceOnlyYieldsNoChunks) {
  // U+00A0, U+3000 and U+2003
  EXPECT_TRUE(chunker_->chunk("\xC2\xA0\xE3\x80\x80\xE2\x80\x83", 500, 50).empty());
  EXPECT_TRUE(chunker_->chunk(" \xC2\x85\xE2\x80\xA8\t", 500, 50).empty());
}

TEST_F(TokenChunkerTest, Chunk_InvalidUtf8IsNotBlank) {
  EXPECT_EQ(chunker_->chunk(" \xFF ", 500, 50).size(), 1u);
}

TEST_F(TokenChunkerTest, Chunk_ShortTextIsOneChunk) {
  std::vector<Chunk> chunks = chunker_->chunk("t0 t1 t2", 10, 2);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, "t0 t1 t2");
  EXPECT_EQ(chunks[0].token_count, 3u);
}

TEST_F(TokenChunkerTest, Chunk_WindowsOverlapByConfiguredTokens) {
  std::string text = TestUtilities::create_word_text(10);

  std::vector<Chunk> chunks = chunker_->chunk(text, 4, 1);

  std::vector<std::string> expected = {"t0 t1 t2 t3", "t3 t4 t5 t6", "t6 t7 t8 t9"};
  EXPECT_EQ(contents(chunks), expected);
}

TEST_F(TokenChunkerTest, Chunk_LastWindowMayBeShorter) {
  std::string text = TestUtilities::create_word_text(10);

  std::vector<Chunk> chunks = chunker_->chunk(text, 4, 0);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].token_count, 4u);
  EXPECT_EQ(chunks[1].token_count, 4u);
  EXPECT_EQ(chunks[2].token_count, 2u);
  EXPECT_EQ(chunks[2].content, "t8 t9");
}

TEST_F(TokenChunkerTest, Chunk_OverlapNotSmallerThanSizeAdvancesByHalfWindow) {
  std::string text = TestUtilities::create_word_text(10);

  std::vector<Chunk> chunks = chunker_->chunk(text, 4, 4);

  std::vector<std::string> expected = {"t0 t1 t2 t3", "t2 t3 t4 t5", "t4 t5 t6 t7", "t6 t7 t8 t9"};
  EXPECT_EQ(contents(chunks), expected);
}

TEST_F(TokenChunkerTest, Chunk_SingleTokenWindowsStillTerminate) {
  std::string text = TestUtilities::create_word_text(5);

  std::vector<Chunk> chunks = chunker_->chunk(text, 1, 3);

  std::vector<std::string> expected = {"t0", "t1", "t2", "t3", "t4"};
  EXPECT_EQ(contents(chunks), expected);
}

TEST_F(TokenChunkerTest, Chunk_EveryChunkRespectsTheWindowSize) {
  std::string text = TestUtilities::create_word_text(101);

  std::vector<Chunk> chunks = chunker_->chunk(text, 16, 5);

  ASSERT_FALSE(chunks.empty());
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.token_count, 16u);
    EXPECT_GT(chunk.token_count, 0u);
  }
  EXPECT_EQ(chunks.front().content.substr(0, 3), "t0 ");
  EXPECT_EQ(chunks.back().content.substr(chunks.back().content.size() - 4), "t100");
}

namespace {

// Tracks how many instances are alive
class CountingTokenizer : public WordTokenizer {
 public:
  explicit CountingTokenizer(int* alive) : alive_(alive) {
    ++*alive_;
  }
  ~CountingTokenizer() override {
    --*alive_;
  }

 private:
  int* alive_;
};

// Reports its vocabulary size when released
class RecordingVocabularyTokenizer : public VocabularyTokenizer {
 public:
  explicit RecordingVocabularyTokenizer(std::vector<size_t>* sizes) : sizes_(sizes) {}
  ~RecordingVocabularyTokenizer() override {
    sizes_->push_back(vocab_size());
  }

 private:
  std::vector<size_t>* sizes_;
};

}  // namespace

TEST(TokenChunkerFactoryTest, Chunk_UsesAFreshTokenizerPerCall) {
  int alive = 0;
  int created = 0;
  TokenChunker chunker([&alive, &created]() {
    ++created;
    return std::make_unique<CountingTokenizer>(&alive);
  });

  chunker.chunk(TestUtilities::create_word_text(10, "a"), 4, 1);
  chunker.chunk(TestUtilities::create_word_text(10, "b"), 4, 1);
  chunker.chunk("   ", 4, 1);

  EXPECT_EQ(created, 2);
  EXPECT_EQ(alive, 0);
}

TEST(TokenChunkerFactoryTest, Chunk_VocabularyDoesNotCarryOverBetweenCalls) {
  std::vector<size_t> vocab_sizes;
  TokenChunker chunker([&vocab_sizes]() {
    return std::make_unique<RecordingVocabularyTokenizer>(&vocab_sizes);
  });

  for (int round = 0; round < 50; ++round) {
    chunker.chunk(TestUtilities::create_word_text(20, "w" + std::to_string(round) + "_"), 8, 2);
  }

  ASSERT_EQ(vocab_sizes.size(), 50u);
  for (size_t size : vocab_sizes) {
    // 20 distinct words plus the single-space separator
    EXPECT_EQ(size, 21u);
  }
}

TEST(TokenChunkerVocabularyTest, Chunk_WithoutOverlapReassemblesOriginalText) {
  TokenChunker chunker([]() { return std::make_unique<VocabularyTokenizer>(); });
  const std::string text =
      "The sky is blue on a clear day.\nParis is the capital of France, and Spain is sunny.";

  std::vector<Chunk> chunks = chunker.chunk(text, 5, 0);

  std::string reassembled;
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.token_count, 5u);
    reassembled += chunk.content;
  }
  EXPECT_GT(chunks.size(), 1u);
  EXPECT_EQ(reassembled, text);
}

}  // namespace rag_tests
