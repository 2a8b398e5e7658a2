#pragma once
#include <string>
#include <vector>

// Maps text to token ids. Implementations may throw on failure.
class Tokenizer {
public:
  virtual ~Tokenizer() = default;
  virtual std::vector<int> tokenize(const std::string& text) const = 0;
};

// Deterministic subword tokenizer used when no model vocabulary is loaded.
// Whitespace never produces tokens, so counts add up across whitespace joins.
// Letter runs are cut into pieces of at most max_piece bytes, digit runs into
// groups of three, and every other symbol is a token of its own.
class SubwordTokenizer : public Tokenizer {
public:
  explicit SubwordTokenizer(int max_piece = 6, int vocab_size = 50000);
  std::vector<int> tokenize(const std::string& text) const override;

private:
  int max_piece_;
  int vocab_size_;
};

// ceil(words * 0.75)
int estimate_tokens(const std::string& text);

// Token count through tok, falling back to estimate_tokens when it throws.
int count_tokens(const Tokenizer& tok, const std::string& text);
