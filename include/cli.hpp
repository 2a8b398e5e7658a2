#pragma once
#include "config.hpp"
#include <optional>
#include <string>

struct Args {
  std::string mode;          // index, chunk, query, toc, related
  std::string target;        // root path, file, query text or chunk id
  std::string config_path;

  std::optional<std::string> project;
  std::optional<std::string> index_dir;
  std::optional<std::string> embed_model;
  std::optional<std::string> log_level;
  std::optional<int> jobs;

  std::optional<int> min_size;
  std::optional<int> max_size;
  std::optional<int> target_size;
  std::optional<double> overlap;
  bool no_semantic = false;
  bool no_sections = false;
  bool no_heading_context = false;

  std::string strategy = "hybrid";
  int k = 10;
  std::optional<double> threshold;
  std::optional<std::string> document;
  std::optional<std::string> type;
  std::optional<int> level;
  std::optional<int> context;
  int max_depth = 0;
  bool content = false;
};

Args parse_cli(int argc, char** argv);

// Config file (if any) first, then command line flags. Throws ConfigError.
AppConfig resolve_config(const Args& a);
