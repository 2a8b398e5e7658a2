#include "ingest.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class IngestTest : public ::testing::Test {
protected:
  HashEmbedder hash{32};
  EmbeddingService embeddings{&hash};
  SubwordTokenizer tokenizer;
  BoundaryDetector detector{embeddings, tokenizer};
  Chunker chunker{tokenizer, detector};
  HnswChunkStore store{":memory:", "", 32};
  Ingestor ingestor{chunker, embeddings, store};
  fs::path dir;

  void SetUp() override {
    dir = fs::temp_directory_path() / "docchunk_ingest_test";
    fs::remove_all(dir);
    fs::create_directories(dir / "nested");
  }
  void TearDown() override { fs::remove_all(dir); }

  void write(const fs::path& p, const std::string& text) { std::ofstream(p) << text; }
};

TEST_F(IngestTest, TextIsChunkedEmbeddedAndStored) {
  auto report = ingestor.ingest_text("# A\nalpha text.\n\n# B\nbeta text.", "doc", {"id", "doc.md"}, ChunkingConfig{});
  EXPECT_EQ(report.document_id, "doc");
  EXPECT_EQ(report.chunks, 2u);
  EXPECT_FALSE(report.degraded);
  EXPECT_EQ(store.size(), 2u);
  EXPECT_TRUE(store.get("doc#1").has_value());
}

TEST_F(IngestTest, ReingestReplacesDocument) {
  ingestor.ingest_text("# A\nalpha.\n\n# B\nbeta.", "doc", {"id", "doc.md"}, ChunkingConfig{});
  ingestor.ingest_text("just one paragraph now.", "doc", {"id", "doc.md"}, ChunkingConfig{});
  EXPECT_EQ(store.size(), 1u);
  EXPECT_FALSE(store.get("doc#1").has_value());
}

TEST_F(IngestTest, FallbackEmbeddingsAreReported) {
  FailingEmbedder failing(32);
  EmbeddingService fallback(&failing);
  BoundaryDetector det(fallback, tokenizer);
  Chunker ch(tokenizer, det);
  Ingestor ing(ch, fallback, store);
  auto report = ing.ingest_text("some text here.", "weak", {"id", "w.md"}, ChunkingConfig{});
  EXPECT_TRUE(report.degraded);
  EXPECT_EQ(store.size(), 1u);
}

TEST_F(IngestTest, FolderInParallelKeepsFileOrder) {
  write(dir / "a.md", "# One\nfirst file.");
  write(dir / "b.md", "# Two\nsecond file.");
  write(dir / "nested" / "c.txt", "third file.");
  write(dir / "skip.png", "binary");

  auto reports = ingestor.ingest_folder(dir.string(), ChunkingConfig{}, 3);
  ASSERT_EQ(reports.size(), 3u);
  EXPECT_EQ(reports[0].source_file_name, "a.md");
  EXPECT_EQ(reports[1].source_file_name, "b.md");
  EXPECT_EQ(reports[2].source_file_name, "c.txt");
  EXPECT_EQ(store.size(), 3u);
}

TEST_F(IngestTest, InvalidConfigStopsFolderRun) {
  ChunkingConfig bad;
  bad.min_chunk_size = -1;
  EXPECT_THROW(ingestor.ingest_folder(dir.string(), bad), ConfigError);
}
