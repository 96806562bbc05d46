#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "rag_core/chunking/tokenizer.hpp"

namespace rag_core {

/**
 * @class VocabularyTokenizer
 * @brief Splits UTF-8 text into word, whitespace and punctuation pieces and interns each
 * distinct piece as a token id.
 *
 * The vocabulary grows as new pieces are seen, so encoding the same text twice through one
 * instance yields the same ids. Decoding concatenates the pieces back, which makes the round
 * trip exact for valid UTF-8 input. Invalid byte sequences are replaced with U+FFFD before
 * splitting.
 *
 * Meant to live for one chunking call: the vocabulary is never pruned. Not thread-safe.
 */
class VocabularyTokenizer : public Tokenizer {
 public:
  VocabularyTokenizer() = default;

  VocabularyTokenizer(const VocabularyTokenizer &) = delete;
  VocabularyTokenizer &operator=(const VocabularyTokenizer &) = delete;

  std::vector<Token> encode(const std::string &text) const override;
  std::string decode(const std::vector<Token> &tokens) const override;

  size_t vocab_size() const;

  // Splits text into the pieces that become tokens, without touching the vocabulary
  static std::vector<std::string> split_pieces(const std::string &text);

 private:
  Token intern(const std::string &piece) const;

  // encode() is logically const; the vocabulary is a cache of pieces seen so far
  mutable std::unordered_map<std::string, Token> piece_to_id_;
  mutable std::vector<std::string> id_to_piece_;
};

}  // namespace rag_core
