#include "rag_core/chunking/vocabulary_tokenizer.hpp"

#include <utf8.h>

#include <cstdint>
#include <iterator>
#include <limits>
#include <stdexcept>

#include "rag_core/chunking/text_utils.hpp"

namespace rag_core {

namespace {

enum class PieceClass { Whitespace, Word, Symbol };

PieceClass classify(uint32_t cp) {
  if (is_unicode_space(cp)) {
    return PieceClass::Whitespace;
  }
  if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9') ||
      cp == '_' || cp == '\'') {
    return PieceClass::Word;
  }
  // Everything outside ASCII that isn't a known space is treated as part of a word
  if (cp > 0x7F) {
    return PieceClass::Word;
  }
  return PieceClass::Symbol;
}

}  // namespace

std::vector<std::string> VocabularyTokenizer::split_pieces(const std::string &text) {
  std::vector<std::string> pieces;
  if (text.empty()) {
    return pieces;
  }

  std::string clean;
  clean.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(clean));

  std::string current;
  PieceClass current_class = PieceClass::Symbol;

  auto it = clean.begin();
  while (it != clean.end()) {
    auto cp_start = it;
    uint32_t cp = utf8::next(it, clean.end());
    PieceClass cls = classify(cp);

    // Symbols always stand alone; whitespace and word code points extend a run of their class
    bool extends_run = !current.empty() && cls == current_class && cls != PieceClass::Symbol;
    if (!extends_run && !current.empty()) {
      pieces.push_back(std::move(current));
      current.clear();
    }
    current.append(cp_start, it);
    current_class = cls;
  }
  if (!current.empty()) {
    pieces.push_back(std::move(current));
  }
  return pieces;
}

Token VocabularyTokenizer::intern(const std::string &piece) const {
  auto found = piece_to_id_.find(piece);
  if (found != piece_to_id_.end()) {
    return found->second;
  }

  if (id_to_piece_.size() > static_cast<size_t>(std::numeric_limits<Token>::max())) {
    throw std::length_error("VocabularyTokenizer vocabulary is full");
  }
  Token id = static_cast<Token>(id_to_piece_.size());
  id_to_piece_.push_back(piece);
  piece_to_id_.emplace(piece, id);
  return id;
}

std::vector<Token> VocabularyTokenizer::encode(const std::string &text) const {
  std::vector<std::string> pieces = split_pieces(text);
  std::vector<Token> tokens;
  tokens.reserve(pieces.size());
  for (const auto &piece : pieces) {
    tokens.push_back(intern(piece));
  }
  return tokens;
}

std::string VocabularyTokenizer::decode(const std::vector<Token> &tokens) const {
  std::string text;
  for (Token token : tokens) {
    if (token < 0 || static_cast<size_t>(token) >= id_to_piece_.size()) {
      continue;
    }
    text += id_to_piece_[token];
  }
  return text;
}

size_t VocabularyTokenizer::vocab_size() const {
  return id_to_piece_.size();
}

}  // namespace rag_core
