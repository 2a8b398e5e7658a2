#include "text_util.hpp"
#include "tokenizer.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

// ============================================================ text helpers

TEST(TextUtil, TrimAndLower) {
  EXPECT_EQ(trim("  a b \n\t"), "a b");
  EXPECT_EQ(trim("   "), "");
  EXPECT_EQ(to_lower("MiXeD 42"), "mixed 42");
  EXPECT_TRUE(starts_with("```cpp", "```"));
  EXPECT_FALSE(starts_with("``", "```"));
}

TEST(TextUtil, SplitLinesDropsBlanks) {
  auto lines = split_lines("  a \n\n b\n");
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "a");
  EXPECT_EQ(lines[1], "b");
}

TEST(TextUtil, SentencesKeepTerminators) {
  auto s = split_sentences("First one. Second one! Third?");
  ASSERT_EQ(s.size(), 3u);
  EXPECT_EQ(s[0], "First one.");
  EXPECT_EQ(s[1], "Second one!");
  EXPECT_EQ(s[2], "Third?");
}

TEST(TextUtil, SentencesDoNotCutInsideNumbers) {
  auto s = split_sentences("Version 1.2 is out. Wait... what");
  ASSERT_EQ(s.size(), 3u);
  EXPECT_EQ(s[0], "Version 1.2 is out.");
  EXPECT_EQ(s[1], "Wait...");
  EXPECT_EQ(s[2], "what");
}

TEST(TextUtil, NewlineEndsSentence) {
  auto s = split_sentences("no terminator\nnext line");
  ASSERT_EQ(s.size(), 2u);
  EXPECT_EQ(s[1], "next line");
}

TEST(TextUtil, KeywordsByFrequency) {
  auto k = extract_keywords("the cats and the dogs chase cats", 5);
  ASSERT_EQ(k.size(), 3u);
  EXPECT_EQ(k[0], "cats");
  EXPECT_EQ(k[1], "dogs");
  EXPECT_EQ(k[2], "chase");
  EXPECT_EQ(extract_keywords("alpha beta gamma delta epsilon zeta", 2).size(), 2u);
}

TEST(TextUtil, JoinAndTimestamp) {
  EXPECT_EQ(join({"a", "b", "c"}, " > "), "a > b > c");
  EXPECT_EQ(join({}, ","), "");
  auto ts = now_iso8601();
  EXPECT_EQ(ts.size(), 20u);
  EXPECT_EQ(ts.back(), 'Z');
  EXPECT_EQ(ts[10], 'T');
}

// ============================================================ tokenizer

TEST(SubwordTokenizer, CountsPieces) {
  SubwordTokenizer tok;
  EXPECT_EQ(tok.tokenize("hello world").size(), 2u);
  EXPECT_EQ(tok.tokenize("internationalization").size(), 4u);   // 20 letters, pieces of 6
  EXPECT_EQ(tok.tokenize("12345").size(), 2u);
  EXPECT_EQ(tok.tokenize("a, b.").size(), 4u);
  EXPECT_TRUE(tok.tokenize("   \n\t").empty());
}

TEST(SubwordTokenizer, DeterministicAndAdditive) {
  SubwordTokenizer tok;
  EXPECT_EQ(tok.tokenize("Some text, here."), tok.tokenize("Some text, here."));
  EXPECT_EQ(count_tokens(tok, "foo bar\n\nbaz"),
            count_tokens(tok, "foo bar") + count_tokens(tok, "baz"));
  EXPECT_EQ(tok.tokenize("Hello"), tok.tokenize("hello"));
}

TEST(SubwordTokenizer, RejectsBadParameters) {
  EXPECT_THROW(SubwordTokenizer(0), std::invalid_argument);
  EXPECT_THROW(SubwordTokenizer(6, 0), std::invalid_argument);
}

class ThrowingTokenizer : public Tokenizer {
public:
  std::vector<int> tokenize(const std::string&) const override {
    throw std::runtime_error("vocabulary unavailable");
  }
};

TEST(CountTokens, FallsBackToWordEstimate) {
  ThrowingTokenizer tok;
  EXPECT_EQ(count_tokens(tok, "one two three four"), 3);
  EXPECT_EQ(count_tokens(tok, "a b c"), 3);   // ceil(2.25)
  EXPECT_EQ(count_tokens(tok, ""), 0);
  EXPECT_EQ(estimate_tokens("single"), 1);
}
