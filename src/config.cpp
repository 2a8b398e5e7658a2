#include "config.hpp"
#include <filesystem>
#include <fstream>

using nlohmann::json;

std::string AppConfig::project_dir() const {
  return (std::filesystem::path(index_dir) / project).string();
}
std::string AppConfig::sqlite_path() const {
  return (std::filesystem::path(project_dir()) / "chunks.sqlite").string();
}
std::string AppConfig::hnsw_path() const {
  return (std::filesystem::path(project_dir()) / "vectors.hnsw").string();
}

template <typename T>
static void read(const json& j, const char* key, T& dst) {
  if (j.contains(key)) dst = j.at(key).get<T>();
}

void apply_json(AppConfig& cfg, const json& j) {
  if (!j.is_object()) throw ConfigError("config: top level must be an object");
  try {
    if (j.contains("chunking")) {
      const json& c = j.at("chunking");
      read(c, "min_chunk_size", cfg.chunking.min_chunk_size);
      read(c, "max_chunk_size", cfg.chunking.max_chunk_size);
      read(c, "target_chunk_size", cfg.chunking.target_chunk_size);
      read(c, "overlap_percentage", cfg.chunking.overlap_percentage);
      read(c, "prefer_semantic_boundaries", cfg.chunking.prefer_semantic_boundaries);
      read(c, "respect_section_boundaries", cfg.chunking.respect_section_boundaries);
      read(c, "include_heading_context", cfg.chunking.include_heading_context);
    }
    if (j.contains("embedding")) {
      const json& e = j.at("embedding");
      read(e, "dimension", cfg.embedding.dimension);
      read(e, "max_batch_size", cfg.embedding.max_batch_size);
      read(e, "rate_limit_per_minute", cfg.embedding.rate_limit_per_minute);
      read(e, "max_parallel_batches", cfg.embedding.max_parallel_batches);
      read(e, "model", cfg.embed_model);
    }
    if (j.contains("boundary")) {
      const json& b = j.at("boundary");
      read(b, "similarity_threshold", cfg.boundary.similarity_threshold);
      read(b, "window_size", cfg.boundary.window_size);
      read(b, "min_segment_tokens", cfg.boundary.min_segment_tokens);
      read(b, "topic_overlap_threshold", cfg.boundary.topic_overlap_threshold);
    }
    read(j, "project", cfg.project);
    read(j, "index_dir", cfg.index_dir);
    read(j, "log_level", cfg.log_level);
    read(j, "jobs", cfg.jobs);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("config: ") + e.what());
  }
  if (cfg.embedding.dimension < 0) throw ConfigError("config: embedding.dimension must not be negative");
  if (cfg.boundary.window_size < 1) throw ConfigError("config: boundary.window_size must be at least 1");
  if (cfg.jobs < 1) throw ConfigError("config: jobs must be at least 1");
  cfg.chunking.validate();
}

AppConfig load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("config: cannot read " + path);
  json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) throw ConfigError("config: " + path + " is not valid JSON");
  AppConfig cfg;
  apply_json(cfg, j);
  return cfg;
}

json to_json(const AppConfig& cfg) {
  return json{
    {"chunking", {
      {"min_chunk_size", cfg.chunking.min_chunk_size},
      {"max_chunk_size", cfg.chunking.max_chunk_size},
      {"target_chunk_size", cfg.chunking.target_chunk_size},
      {"overlap_percentage", cfg.chunking.overlap_percentage},
      {"prefer_semantic_boundaries", cfg.chunking.prefer_semantic_boundaries},
      {"respect_section_boundaries", cfg.chunking.respect_section_boundaries},
      {"include_heading_context", cfg.chunking.include_heading_context},
    }},
    {"embedding", {
      {"dimension", cfg.embedding.dimension},
      {"max_batch_size", cfg.embedding.max_batch_size},
      {"rate_limit_per_minute", cfg.embedding.rate_limit_per_minute},
      {"max_parallel_batches", cfg.embedding.max_parallel_batches},
      {"model", cfg.embed_model},
    }},
    {"boundary", {
      {"similarity_threshold", cfg.boundary.similarity_threshold},
      {"window_size", cfg.boundary.window_size},
      {"min_segment_tokens", cfg.boundary.min_segment_tokens},
      {"topic_overlap_threshold", cfg.boundary.topic_overlap_threshold},
    }},
    {"project", cfg.project},
    {"index_dir", cfg.index_dir},
    {"log_level", cfg.log_level},
    {"jobs", cfg.jobs},
  };
}
