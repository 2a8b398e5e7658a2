#include "tokenizer.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <stdexcept>

enum class CharClass { Space, Letter, Digit, Symbol };

static CharClass classify(unsigned char c) {
  if (std::isspace(c)) return CharClass::Space;
  if (std::isdigit(c)) return CharClass::Digit;
  // UTF-8 lead and continuation bytes count as letters
  if (std::isalpha(c) || c >= 0x80) return CharClass::Letter;
  return CharClass::Symbol;
}

SubwordTokenizer::SubwordTokenizer(int max_piece, int vocab_size)
  : max_piece_(max_piece), vocab_size_(vocab_size) {
  if (max_piece_ <= 0 || vocab_size_ <= 0) throw std::invalid_argument("tokenizer: bad parameters");
}

std::vector<int> SubwordTokenizer::tokenize(const std::string& text) const {
  std::vector<int> ids;
  auto emit = [&](const std::string& piece) {
    ids.push_back((int)(fnv1a(piece) % (uint64_t)vocab_size_));
  };

  size_t i = 0;
  while (i < text.size()) {
    CharClass cls = classify((unsigned char)text[i]);
    if (cls == CharClass::Space) { ++i; continue; }
    if (cls == CharClass::Symbol) { emit(text.substr(i, 1)); ++i; continue; }

    size_t j = i;
    while (j < text.size() && classify((unsigned char)text[j]) == cls) ++j;
    size_t piece = cls == CharClass::Digit ? 3 : (size_t)max_piece_;
    for (size_t p = i; p < j; p += piece) emit(to_lower(text.substr(p, std::min(piece, j - p))));
    i = j;
  }
  return ids;
}

int estimate_tokens(const std::string& text) {
  return (int)std::ceil(split_words(text).size() * 0.75);
}

int count_tokens(const Tokenizer& tok, const std::string& text) {
  if (text.empty()) return 0;
  try {
    return (int)tok.tokenize(text).size();
  } catch (const std::exception& e) {
    spdlog::debug("tokenizer failed ({}), estimating from word count", e.what());
    return estimate_tokens(text);
  }
}
