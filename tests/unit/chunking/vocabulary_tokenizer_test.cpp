#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rag_core/chunking/vocabulary_tokenizer.hpp"

namespace rag_tests {

using namespace rag_core;

TEST(VocabularyTokenizerTest, SplitPieces_SeparatesWordsWhitespaceAndSymbols) {
  std::vector<std::string> pieces = VocabularyTokenizer::split_pieces("Hello,  world!");

  std::vector<std::string> expected = {"Hello", ",", "  ", "world", "!"};
  EXPECT_EQ(pieces, expected);
}

TEST(VocabularyTokenizerTest, SplitPieces_KeepsApostrophesAndNonAsciiInsideWords) {
  std::vector<std::string> pieces = VocabularyTokenizer::split_pieces("don't Grüße");

  std::vector<std::string> expected = {"don't", " ", "Grüße"};
  EXPECT_EQ(pieces, expected);
}

TEST(VocabularyTokenizerTest, SplitPieces_EmptyTextHasNoPieces) {
  EXPECT_TRUE(VocabularyTokenizer::split_pieces("").empty());
}

TEST(VocabularyTokenizerTest, Encode_SameTextYieldsSameIds) {
  VocabularyTokenizer tokenizer;

  std::vector<Token> first = tokenizer.encode("the sky is blue");
  std::vector<Token> second = tokenizer.encode("the sky is blue");

  EXPECT_EQ(first, second);
  EXPECT_EQ(first.size(), 7u);
}

TEST(VocabularyTokenizerTest, Encode_RepeatedPiecesShareAnId) {
  VocabularyTokenizer tokenizer;

  std::vector<Token> tokens = tokenizer.encode("x y x");

  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[0], tokens[4]);
  EXPECT_EQ(tokens[1], tokens[3]);
  EXPECT_NE(tokens[0], tokens[2]);
  EXPECT_EQ(tokenizer.vocab_size(), 3u);
}

TEST(VocabularyTokenizerTest, Decode_RoundTripsValidUtf8) {
  VocabularyTokenizer tokenizer;
  const std::string text = "Grüße aus Köln, 東京!\n\tEnd of line.";

  EXPECT_EQ(tokenizer.decode(tokenizer.encode(text)), text);
}

TEST(VocabularyTokenizerTest, Decode_SkipsUnknownIds) {
  VocabularyTokenizer tokenizer;
  std::vector<Token> tokens = tokenizer.encode("hello");
  tokens.push_back(9999);
  tokens.push_back(-1);

  EXPECT_EQ(tokenizer.decode(tokens), "hello");
}

TEST(VocabularyTokenizerTest, Encode_ReplacesInvalidUtf8) {
  VocabularyTokenizer tokenizer;
  const std::string invalid = std::string("abc") + static_cast<char>(0xFF);

  std::string decoded = tokenizer.decode(tokenizer.encode(invalid));

  EXPECT_EQ(decoded, "abc\xEF\xBF\xBD");
}

TEST(VocabularyTokenizerTest, SplitPieces_TreatsUnicodeSpacesAsWhitespace) {
  // U+2003 EM SPACE and U+00A0 NO-BREAK SPACE between the words
  std::vector<std::string> pieces = VocabularyTokenizer::split_pieces("a\xE2\x80\x83\xC2\xA0" "b");

  std::vector<std::string> expected = {"a", "\xE2\x80\x83\xC2\xA0", "b"};
  EXPECT_EQ(pieces, expected);
}

TEST(VocabularyTokenizerTest, VocabSize_CountsOnlyPiecesThisInstanceHasSeen) {
  VocabularyTokenizer first;
  first.encode("alpha beta gamma delta alpha beta");

  VocabularyTokenizer second;
  second.encode("epsilon");

  // alpha, beta, gamma, delta and the single space
  EXPECT_EQ(first.vocab_size(), 5u);
  EXPECT_EQ(second.vocab_size(), 1u);
}

}  // namespace rag_tests
