#pragma once
#include "boundary.hpp"
#include "chunker.hpp"
#include "embedder.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct AppConfig {
  ChunkingConfig chunking;
  EmbeddingConfig embedding;
  BoundaryConfig boundary;
  std::string project = "default";
  std::string index_dir = "./index";
  std::string embed_model;          // empty: fallback embeddings only
  std::string log_level = "info";
  int jobs = 1;

  std::string project_dir() const;  // <index_dir>/<project>
  std::string sqlite_path() const;
  std::string hnsw_path() const;
};

// Overlays the fields present in j onto cfg. Throws ConfigError.
void apply_json(AppConfig& cfg, const nlohmann::json& j);

// Reads a JSON config file over the defaults. Throws ConfigError.
AppConfig load_config(const std::string& path);

nlohmann::json to_json(const AppConfig& cfg);
