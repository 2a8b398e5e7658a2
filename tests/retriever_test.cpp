#include "retriever.hpp"
#include "text_util.hpp"
#include <gtest/gtest.h>
#include <set>

namespace {

DocumentChunk make(const std::string& doc, int pos, const std::string& content, int level,
                   std::vector<std::string> path, ChunkType type = ChunkType::Paragraph) {
  DocumentChunk c;
  c.document_id = doc;
  c.position = pos;
  c.id = doc + "#" + std::to_string(pos);
  c.content = content;
  c.hierarchy_level = level;
  c.heading_path = std::move(path);
  c.chunk_type = type;
  c.topic_keywords = extract_keywords(content, 5);
  return c;
}

// Every call fails the way a corrupted store would.
class BrokenStore : public VectorStore {
public:
  void upsert(const DocumentChunk&, const std::vector<float>&) override { fail(); }
  void upsert_batch(const std::vector<DocumentChunk>&, const std::vector<std::vector<float>>&) override { fail(); }
  void replace_document(const std::string&, const std::vector<DocumentChunk>&,
                        const std::vector<std::vector<float>>&) override { fail(); }
  std::vector<VectorHit> query(const std::vector<float>&, int, const ChunkFilter&) const override { fail(); }
  std::vector<DocumentChunk> get_by_filter(const ChunkFilter&, int) const override { fail(); }
  std::optional<DocumentChunk> get(const std::string&) const override { fail(); }
  void remove_document(const std::string&) override { fail(); }
  size_t size() const override { return 0; }

private:
  [[noreturn]] static void fail() { throw StoreError("store: malformed chunk row x"); }
};

} // namespace

class RetrieverTest : public ::testing::Test {
protected:
  HashEmbedder hash{64};
  EmbeddingService embeddings{&hash};
  HnswChunkStore store{":memory:", "", 64};
  Retriever retriever{store, embeddings};

  void SetUp() override {
    std::vector<DocumentChunk> handbook = {
      make("handbook", 0, "# 1. Overview\n\nThe handbook covers student records.", 1, {"1. Overview"}, ChunkType::Heading),
      make("handbook", 1, "Records are kept for five years.", 1, {"1. Overview"}),
      make("handbook", 2, "# 2. Privacy\n\nFERPA consent procedures apply to all disclosures.", 1, {"2. Privacy"}, ChunkType::Heading),
      make("handbook", 3, "## 2.1 Requests\n\nParents may request consent forms under FERPA.", 2,
           {"2. Privacy", "2.1 Requests"}, ChunkType::Heading),
      make("handbook", 4, "Requests are answered within ten days.", 2, {"2. Privacy", "2.1 Requests"}),
    };
    handbook[1].parent_section_id = "handbook#0";
    handbook[0].child_chunk_ids = {"handbook#1"};
    handbook[3].parent_section_id = "handbook#2";
    handbook[2].child_chunk_ids = {"handbook#3"};
    handbook[4].parent_section_id = "handbook#3";
    handbook[3].child_chunk_ids = {"handbook#4"};
    handbook[3].sibling_chunk_ids = {"handbook#4"};
    handbook[4].sibling_chunk_ids = {"handbook#3"};
    index(handbook);
    index({make("guide", 0, "# Setup\n\nInstall the tools and run the consent wizard.", 1, {"Setup"}, ChunkType::Heading)});
  }

  void index(const std::vector<DocumentChunk>& chunks) {
    std::vector<std::string> texts;
    for (auto& c : chunks) texts.push_back(c.content);
    store.replace_document(chunks[0].document_id, chunks, embeddings.embed(texts).vectors);
  }

  static std::vector<std::string> ids(const RetrievalResult& r) {
    std::vector<std::string> out;
    for (auto& c : r.chunks) out.push_back(c.chunk.id);
    return out;
  }
};

// ============================================================ helpers

TEST(RetrieverHelpers, DeduplicateKeepsFirst) {
  std::vector<RetrievedChunk> in = {
    {make("d", 0, "a", 1, {}), 0.9, {}},
    {make("d", 1, "b", 1, {}), std::nullopt, {}},
    {make("d", 0, "a", 1, {}), 0.1, {}},
  };
  auto out = deduplicate(in);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_DOUBLE_EQ(out[0].similarity.value_or(0), 0.9);
}

TEST(RetrieverHelpers, AggregateMetadata) {
  std::vector<RetrievedChunk> in = {
    {make("b", 0, "x", 2, {"S", "T"}), 0.8, {}},
    {make("a", 1, "y", 1, {"S"}), 0.4, {}},
    {make("b", 2, "z", 2, {"S", "T"}), std::nullopt, {}},
  };
  auto m = aggregate_metadata(in);
  EXPECT_EQ(m.documents_covered, (std::vector<std::string>{"b", "a"}));
  EXPECT_EQ(m.heading_paths_covered, (std::vector<std::string>{"S > T", "S"}));
  EXPECT_EQ(m.hierarchy_levels, (std::vector<int>{1, 2}));
  ASSERT_TRUE(m.average_similarity.has_value());
  EXPECT_NEAR(*m.average_similarity, 0.6, 1e-9);

  auto empty = aggregate_metadata({});
  EXPECT_TRUE(empty.documents_covered.empty());
  EXPECT_FALSE(empty.average_similarity.has_value());
}

TEST(RetrieverHelpers, StrategyNames) {
  EXPECT_EQ(retrieval_strategy_from_string("contextual"), RetrievalStrategy::Contextual);
  EXPECT_STREQ(to_string(RetrievalStrategy::Keyword), "keyword");
  EXPECT_THROW(retrieval_strategy_from_string("fuzzy"), std::invalid_argument);
}

// ============================================================ strategies

TEST_F(RetrieverTest, KeywordRanksExactPhraseFirst) {
  auto r = retriever.retrieve("FERPA consent", RetrievalStrategy::Keyword);
  ASSERT_FALSE(r.chunks.empty());
  EXPECT_EQ(r.chunks[0].chunk.id, "handbook#2");
  EXPECT_EQ(r.strategy, RetrievalStrategy::Keyword);
  EXPECT_EQ(r.total_found, r.chunks.size());
  EXPECT_FALSE(r.chunks[0].similarity.has_value());
}

TEST_F(RetrieverTest, HierarchicalSectionNumber) {
  auto r = retriever.retrieve("section 2", RetrievalStrategy::Hierarchical);
  EXPECT_EQ(ids(r), (std::vector<std::string>{"handbook#2", "handbook#3", "handbook#4"}));
  for (auto& c : r.chunks) EXPECT_EQ(c.chunk.heading_path.front(), "2. Privacy");
  EXPECT_EQ(r.aggregated_metadata.hierarchy_levels, (std::vector<int>{1, 2}));
}

TEST_F(RetrieverTest, HierarchicalLevel) {
  auto r = retriever.retrieve("everything at level 2", RetrievalStrategy::Hierarchical);
  EXPECT_EQ(ids(r), (std::vector<std::string>{"handbook#3", "handbook#4"}));
}

TEST_F(RetrieverTest, HierarchicalWithoutCuesIsEmpty) {
  auto r = retriever.retrieve("records", RetrievalStrategy::Hierarchical);
  EXPECT_TRUE(r.chunks.empty());
  EXPECT_EQ(r.total_found, 0u);
}

TEST_F(RetrieverTest, SemanticFindsClosestAndHonoursThreshold) {
  RetrievalOptions opt;
  opt.max_results = 3;
  auto r = retriever.retrieve("FERPA consent procedures apply to all disclosures", RetrievalStrategy::Semantic, opt);
  ASSERT_FALSE(r.chunks.empty());
  EXPECT_EQ(r.chunks[0].chunk.id, "handbook#2");
  for (auto& c : r.chunks) {
    ASSERT_TRUE(c.similarity.has_value());
    EXPECT_GE(*c.similarity, opt.similarity_threshold);
  }
  EXPECT_FALSE(r.degraded);

  opt.similarity_threshold = 1.01;
  auto none = retriever.retrieve("FERPA consent", RetrievalStrategy::Semantic, opt);
  EXPECT_TRUE(none.chunks.empty());
  EXPECT_TRUE(none.aggregated_metadata.documents_covered.empty());
}

TEST_F(RetrieverTest, SemanticFilter) {
  RetrievalOptions opt;
  opt.similarity_threshold = 0.0;
  opt.filter.document_id = "guide";
  auto r = retriever.retrieve("consent", RetrievalStrategy::Semantic, opt);
  ASSERT_EQ(r.chunks.size(), 1u);
  EXPECT_EQ(r.chunks[0].chunk.document_id, "guide");
}

TEST_F(RetrieverTest, ContextualAttachesNeighbours) {
  RetrievalOptions opt;
  opt.max_results = 1;
  auto r = retriever.retrieve("Records are kept for five years.", RetrievalStrategy::Contextual, opt);
  ASSERT_EQ(r.chunks.size(), 1u);
  EXPECT_EQ(r.chunks[0].chunk.id, "handbook#1");
  std::set<std::string> ctx;
  for (auto& c : r.chunks[0].context) ctx.insert(c.id);
  EXPECT_EQ(ctx, (std::set<std::string>{"handbook#0", "handbook#2", "handbook#3"}));
}

TEST_F(RetrieverTest, HybridMergesWithoutDuplicates) {
  RetrievalOptions opt;
  opt.max_results = 4;
  opt.similarity_threshold = 0.0;
  auto r = retriever.retrieve("section 2 privacy FERPA", RetrievalStrategy::Hybrid, opt);
  ASSERT_FALSE(r.chunks.empty());
  EXPECT_LE(r.chunks.size(), 4u);
  std::set<std::string> seen;
  for (auto& c : r.chunks) EXPECT_TRUE(seen.insert(c.chunk.id).second) << c.chunk.id;
  EXPECT_EQ(r.strategy, RetrievalStrategy::Hybrid);
  EXPECT_GE(r.processing_time_ms, 0.0);
}

TEST_F(RetrieverTest, HybridSurvivesOverflowingLevel) {
  RetrievalOptions opt;
  opt.similarity_threshold = 0.0;
  auto r = retriever.retrieve("FERPA consent at level 99999999999", RetrievalStrategy::Hybrid, opt);
  ASSERT_FALSE(r.chunks.empty());
  for (auto& c : r.chunks) EXPECT_TRUE(c.similarity.has_value()) << c.chunk.id;
}

TEST_F(RetrieverTest, BrokenStoreGivesEmptyResult) {
  BrokenStore broken;
  Retriever r(broken, embeddings);
  for (auto s : {RetrievalStrategy::Semantic, RetrievalStrategy::Hierarchical, RetrievalStrategy::Hybrid,
                 RetrievalStrategy::Contextual, RetrievalStrategy::Keyword}) {
    auto res = r.retrieve("section 2 consent", s);
    EXPECT_TRUE(res.chunks.empty()) << to_string(s);
    EXPECT_EQ(res.total_found, 0u);
    EXPECT_EQ(res.strategy, s);
    EXPECT_TRUE(res.aggregated_metadata.documents_covered.empty());
    EXPECT_FALSE(res.aggregated_metadata.average_similarity.has_value());
  }
  EXPECT_TRUE(r.browse_by_structure().entries.empty());
  EXPECT_TRUE(r.related_chunks("handbook#1").empty());
}

// ============================================================ structure

TEST_F(RetrieverTest, TableOfContents) {
  TocOptions opt;
  opt.include_content = true;
  auto toc = retriever.browse_by_structure(opt);
  EXPECT_EQ(toc.total_headings, 4u);
  ASSERT_EQ(toc.entries.size(), 3u);
  EXPECT_EQ(toc.entries[0].title, "Setup");
  EXPECT_EQ(toc.entries[1].title, "1. Overview");
  ASSERT_EQ(toc.entries[1].content.size(), 1u);
  EXPECT_EQ(toc.entries[1].content[0].id, "handbook#1");

  const auto& privacy = toc.entries[2];
  EXPECT_EQ(privacy.title, "2. Privacy");
  ASSERT_EQ(privacy.children.size(), 1u);
  EXPECT_EQ(privacy.children[0].title, "2.1 Requests");
  EXPECT_EQ(privacy.children[0].depth, 2);
  ASSERT_EQ(privacy.children[0].content.size(), 1u);
  EXPECT_EQ(privacy.children[0].content[0].id, "handbook#4");
}

TEST_F(RetrieverTest, TableOfContentsDepthAndDocument) {
  TocOptions opt;
  opt.document_id = "handbook";
  opt.max_depth = 1;
  auto toc = retriever.browse_by_structure(opt);
  EXPECT_EQ(toc.total_headings, 2u);
  ASSERT_EQ(toc.entries.size(), 2u);
  EXPECT_TRUE(toc.entries[1].children.empty());
  EXPECT_TRUE(toc.entries[1].content.empty());
}

TEST_F(RetrieverTest, RelatedChunks) {
  auto rel = retriever.related_chunks("handbook#3");
  std::set<std::string> got;
  for (auto& r : rel) EXPECT_TRUE(got.insert(r.chunk.id).second) << r.chunk.id;
  EXPECT_TRUE(got.count("handbook#2"));
  EXPECT_TRUE(got.count("handbook#4"));
  EXPECT_FALSE(got.count("handbook#3"));

  RelatedOptions small;
  small.max_results = 1;
  EXPECT_EQ(retriever.related_chunks("handbook#3", small).size(), 1u);
  EXPECT_TRUE(retriever.related_chunks("missing#0").empty());
}
