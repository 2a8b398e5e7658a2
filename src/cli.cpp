#include "cli.hpp"
#include <cstdlib>
#include <iostream>

static const char* USAGE =
"docchunk index <root|file> [--project P] [--index-dir D] [--embed-model M] [--config F] [--jobs N] [chunk flags]\n"
"docchunk chunk <file> [--embed-model M] [--config F] [chunk flags]\n"
"docchunk query \"text\" [--strategy semantic|hierarchical|hybrid|contextual|keyword] [-k N] [--threshold X]\n"
"                      [--document ID] [--type T] [--level N] [--context N]\n"
"docchunk toc [--document ID] [--max-depth N] [--content]\n"
"docchunk related <chunk-id> [-k N] [--threshold X]\n"
"chunk flags: --min N --max N --target N --overlap P --no-semantic --no-sections --no-heading-context\n"
"common: --log-level trace|debug|info|warn|error\n";

[[noreturn]] static void usage() { std::cerr << USAGE; std::exit(1); }

template <typename T, typename F>
static T parse_number(const std::string& flag, const std::string& v, F conv) {
  try {
    size_t used = 0;
    T out = conv(v, &used);
    if (used != v.size()) throw std::invalid_argument(v);
    return out;
  } catch (const std::exception&) {
    std::cerr << "Invalid number for " << flag << ": " << v << "\n";
    std::exit(1);
  }
}

static int to_int(const std::string& flag, const std::string& v) {
  return parse_number<int>(flag, v, [](const std::string& s, size_t* n) { return std::stoi(s, n); });
}
static double to_double(const std::string& flag, const std::string& v) {
  return parse_number<double>(flag, v, [](const std::string& s, size_t* n) { return std::stod(s, n); });
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) usage();
  a.mode = argv[1];
  int i = 2;
  if (a.mode == "index" || a.mode == "chunk" || a.mode == "query" || a.mode == "related") {
    if (i >= argc) usage();
    a.target = argv[i++];
  } else if (a.mode != "toc") {
    usage();
  }

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&]() -> std::string {
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      return argv[i++];
    };
    if (f == "--config") a.config_path = next();
    else if (f == "--project") a.project = next();
    else if (f == "--index-dir") a.index_dir = next();
    else if (f == "--embed-model") a.embed_model = next();
    else if (f == "--log-level") a.log_level = next();
    else if (f == "--jobs") a.jobs = to_int(f, next());
    else if (f == "--min") a.min_size = to_int(f, next());
    else if (f == "--max") a.max_size = to_int(f, next());
    else if (f == "--target") a.target_size = to_int(f, next());
    else if (f == "--overlap") a.overlap = to_double(f, next());
    else if (f == "--no-semantic") a.no_semantic = true;
    else if (f == "--no-sections") a.no_sections = true;
    else if (f == "--no-heading-context") a.no_heading_context = true;
    else if (f == "--strategy") a.strategy = next();
    else if (f == "-k") a.k = to_int(f, next());
    else if (f == "--threshold") a.threshold = to_double(f, next());
    else if (f == "--document") a.document = next();
    else if (f == "--type") a.type = next();
    else if (f == "--level") a.level = to_int(f, next());
    else if (f == "--context") a.context = to_int(f, next());
    else if (f == "--max-depth") a.max_depth = to_int(f, next());
    else if (f == "--content") a.content = true;
    else { std::cerr << "Unknown flag: " << f << "\n"; usage(); }
  }
  return a;
}

AppConfig resolve_config(const Args& a) {
  AppConfig cfg = a.config_path.empty() ? AppConfig{} : load_config(a.config_path);
  if (a.project) cfg.project = *a.project;
  if (a.index_dir) cfg.index_dir = *a.index_dir;
  if (a.embed_model) cfg.embed_model = *a.embed_model;
  if (a.log_level) cfg.log_level = *a.log_level;
  if (a.jobs) cfg.jobs = *a.jobs;
  if (a.min_size) cfg.chunking.min_chunk_size = *a.min_size;
  if (a.max_size) cfg.chunking.max_chunk_size = *a.max_size;
  if (a.target_size) cfg.chunking.target_chunk_size = *a.target_size;
  if (a.overlap) cfg.chunking.overlap_percentage = *a.overlap;
  if (a.no_semantic) cfg.chunking.prefer_semantic_boundaries = false;
  if (a.no_sections) cfg.chunking.respect_section_boundaries = false;
  if (a.no_heading_context) cfg.chunking.include_heading_context = false;
  if (cfg.jobs < 1) throw ConfigError("jobs must be at least 1");
  cfg.chunking.validate();
  return cfg;
}
