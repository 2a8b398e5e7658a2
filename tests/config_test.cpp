#include "config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using nlohmann::json;

TEST(AppConfig, Defaults) {
  AppConfig cfg;
  EXPECT_EQ(cfg.chunking.min_chunk_size, 200);
  EXPECT_EQ(cfg.chunking.max_chunk_size, 500);
  EXPECT_EQ(cfg.chunking.target_chunk_size, 400);
  EXPECT_DOUBLE_EQ(cfg.boundary.similarity_threshold, 0.7);
  EXPECT_EQ(cfg.embedding.max_batch_size, 10u);
  EXPECT_EQ(cfg.project_dir(), (fs::path("./index") / "default").string());
  EXPECT_EQ(fs::path(cfg.sqlite_path()).filename().string(), "chunks.sqlite");
  EXPECT_EQ(fs::path(cfg.hnsw_path()).filename().string(), "vectors.hnsw");
}

TEST(AppConfig, OverlaysPresentFields) {
  AppConfig cfg;
  apply_json(cfg, json{
    {"chunking", {{"min_chunk_size", 50}, {"target_chunk_size", 80}, {"max_chunk_size", 120},
                  {"prefer_semantic_boundaries", false}}},
    {"embedding", {{"model", "/models/e5.gguf"}, {"max_parallel_batches", 4}}},
    {"boundary", {{"window_size", 2}}},
    {"project", "handbooks"},
    {"jobs", 3},
  });
  EXPECT_EQ(cfg.chunking.min_chunk_size, 50);
  EXPECT_EQ(cfg.chunking.max_chunk_size, 120);
  EXPECT_FALSE(cfg.chunking.prefer_semantic_boundaries);
  EXPECT_TRUE(cfg.chunking.respect_section_boundaries);
  EXPECT_EQ(cfg.embed_model, "/models/e5.gguf");
  EXPECT_EQ(cfg.embedding.max_parallel_batches, 4);
  EXPECT_EQ(cfg.boundary.window_size, 2);
  EXPECT_EQ(cfg.boundary.min_segment_tokens, 100);
  EXPECT_EQ(cfg.project, "handbooks");
  EXPECT_EQ(cfg.jobs, 3);
}

TEST(AppConfig, RejectsBadValues) {
  AppConfig cfg;
  EXPECT_THROW(apply_json(cfg, json{{"chunking", {{"min_chunk_size", 900}}}}), ConfigError);
  cfg = AppConfig{};
  EXPECT_THROW(apply_json(cfg, json{{"jobs", 0}}), ConfigError);
  cfg = AppConfig{};
  EXPECT_THROW(apply_json(cfg, json{{"boundary", {{"window_size", "wide"}}}}), ConfigError);
  cfg = AppConfig{};
  EXPECT_THROW(apply_json(cfg, json::array()), ConfigError);
  cfg = AppConfig{};
  EXPECT_THROW(apply_json(cfg, json{{"embedding", {{"dimension", -1}}}}), ConfigError);
}

TEST(AppConfig, LoadFromFile) {
  fs::path dir = fs::temp_directory_path() / "docchunk_config_test";
  fs::create_directories(dir);
  fs::path good = dir / "good.json";
  fs::path bad = dir / "bad.json";
  { std::ofstream(good) << R"({"project": "p1", "chunking": {"overlap_percentage": 5}})"; }
  { std::ofstream(bad) << "{ not json"; }

  auto cfg = load_config(good.string());
  EXPECT_EQ(cfg.project, "p1");
  EXPECT_DOUBLE_EQ(cfg.chunking.overlap_percentage, 5.0);
  EXPECT_THROW(load_config(bad.string()), ConfigError);
  EXPECT_THROW(load_config((dir / "missing.json").string()), ConfigError);
  fs::remove_all(dir);
}

TEST(AppConfig, JsonRoundTrip) {
  AppConfig cfg;
  cfg.project = "x";
  cfg.chunking.overlap_percentage = 12.5;
  cfg.embed_model = "m.gguf";
  AppConfig back;
  apply_json(back, to_json(cfg));
  EXPECT_EQ(back.project, "x");
  EXPECT_DOUBLE_EQ(back.chunking.overlap_percentage, 12.5);
  EXPECT_EQ(back.embed_model, "m.gguf");
}
