#include "cli.hpp"
#include "boundary.hpp"
#include "chunker.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "ingest.hpp"
#include "retriever.hpp"
#include "store.hpp"
#include "tokenizer.hpp"
#include "vector_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;
using nlohmann::json;

static json report_to_json(const IngestReport& r) {
  return json{{"document_id", r.document_id},
              {"source_file_name", r.source_file_name},
              {"chunks", r.chunks},
              {"tokens", r.tokens},
              {"semantic_coherence", r.semantic_coherence},
              {"degraded", r.degraded}};
}

static json result_to_json(const ChunkingResult& r) {
  json chunks = json::array();
  for (auto& c : r.chunks) chunks.push_back(chunk_to_json(c));
  return json{{"chunks", chunks},
              {"total_chunks", r.total_chunks},
              {"total_tokens", r.total_tokens},
              {"average_chunk_size", r.average_chunk_size},
              {"overlap_efficiency", r.overlap_efficiency},
              {"semantic_coherence", r.semantic_coherence},
              {"hierarchy_preservation", r.hierarchy_preservation},
              {"degraded", r.degraded}};
}

static json retrieved_to_json(const RetrievedChunk& r) {
  json j{{"chunk", chunk_to_json(r.chunk)}};
  j["similarity"] = r.similarity ? json(*r.similarity) : json(nullptr);
  json ctx = json::array();
  for (auto& c : r.context) ctx.push_back(c.id);
  j["context"] = ctx;
  return j;
}

static json result_to_json(const RetrievalResult& r) {
  json chunks = json::array();
  for (auto& c : r.chunks) chunks.push_back(retrieved_to_json(c));
  const auto& m = r.aggregated_metadata;
  json meta{{"documents_covered", m.documents_covered},
            {"heading_paths_covered", m.heading_paths_covered},
            {"hierarchy_levels", m.hierarchy_levels}};
  meta["average_similarity"] = m.average_similarity ? json(*m.average_similarity) : json(nullptr);
  return json{{"chunks", chunks},
              {"total_found", r.total_found},
              {"strategy", to_string(r.strategy)},
              {"processing_time_ms", r.processing_time_ms},
              {"aggregated_metadata", meta},
              {"degraded", r.degraded}};
}

static json toc_to_json(const TocEntry& e) {
  json children = json::array();
  for (auto& c : e.children) children.push_back(toc_to_json(c));
  json content = json::array();
  for (auto& c : e.content) content.push_back(c.id);
  return json{{"title", e.title},
              {"depth", e.depth},
              {"chunk_id", e.heading.id},
              {"document_id", e.heading.document_id},
              {"content", content},
              {"children", children}};
}

static void setup_logging(const std::string& level) {
  auto logger = spdlog::stderr_color_mt("docchunk");
  spdlog::set_default_logger(logger);
  auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") {
    spdlog::warn("unknown log level '{}', using info", level);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

static int run(const Args& args, const AppConfig& cfg) {
  std::unique_ptr<LlamaEmbedder> llama;
  if (!cfg.embed_model.empty()) {
    try {
      llama.reset(new LlamaEmbedder(cfg.embed_model));
      spdlog::info("loaded embedding model {} (dim {})", cfg.embed_model, llama->dim());
    } catch (const std::exception& e) {
      spdlog::warn("embedding model unavailable ({}); using fallback embeddings", e.what());
    }
  }
  SubwordTokenizer subword;
  const Tokenizer& tokenizer = llama ? static_cast<const Tokenizer&>(*llama) : subword;

  EmbeddingService embeddings(llama.get(), cfg.embedding);
  BoundaryDetector detector(embeddings, tokenizer, cfg.boundary);
  Chunker chunker(tokenizer, detector);

  if (args.mode == "chunk") {
    auto res = chunker.chunk_file(args.target, cfg.chunking);
    std::cout << result_to_json(res).dump(2) << "\n";
    return 0;
  }

  fs::create_directories(cfg.project_dir());
  HnswChunkStore store(cfg.sqlite_path(), cfg.hnsw_path(), embeddings.dim());

  if (args.mode == "index") {
    Ingestor ingestor(chunker, embeddings, store);
    std::vector<IngestReport> reports;
    if (fs::is_directory(args.target)) {
      reports = ingestor.ingest_folder(args.target, cfg.chunking, cfg.jobs);
    } else {
      reports.push_back(ingestor.ingest_file(args.target, cfg.chunking));
    }
    store.save();

    json docs = json::array();
    size_t degraded = 0;
    for (auto& r : reports) {
      docs.push_back(report_to_json(r));
      if (r.degraded) ++degraded;
    }
    std::cout << json{{"documents", docs},
                      {"degraded_documents", degraded},
                      {"stored_chunks", store.size()},
                      {"stored_vectors", store.vector_count()}}.dump(2) << "\n";
    spdlog::info("Done. {} documents, {} chunks in {}", reports.size(), store.size(), cfg.project_dir());
    return 0;
  }

  Retriever retriever(store, embeddings);

  if (args.mode == "query") {
    RetrievalOptions opt;
    opt.max_results = args.k;
    if (args.threshold) opt.similarity_threshold = *args.threshold;
    if (args.context) {
      opt.include_context = true;
      opt.context_window = *args.context;
    }
    opt.filter.document_id = args.document;
    if (args.type) opt.filter.chunk_type = chunk_type_from_string(*args.type);
    opt.filter.hierarchy_level = args.level;
    auto res = retriever.retrieve(args.target, retrieval_strategy_from_string(args.strategy), opt);
    std::cout << result_to_json(res).dump(2) << "\n";
    return 0;
  }

  if (args.mode == "toc") {
    TocOptions opt;
    opt.document_id = args.document;
    opt.max_depth = args.max_depth;
    opt.include_content = args.content;
    auto toc = retriever.browse_by_structure(opt);
    json entries = json::array();
    for (auto& e : toc.entries) entries.push_back(toc_to_json(e));
    std::cout << json{{"entries", entries}, {"total_headings", toc.total_headings}}.dump(2) << "\n";
    return 0;
  }

  if (args.mode == "related") {
    RelatedOptions opt;
    opt.max_results = args.k;
    if (args.threshold) opt.similarity_threshold = *args.threshold;
    json out = json::array();
    for (auto& r : retriever.related_chunks(args.target, opt)) out.push_back(retrieved_to_json(r));
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);

  AppConfig cfg;
  try {
    cfg = resolve_config(args);
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << "\n";
    return 1;
  }
  setup_logging(cfg.log_level);

  try {
    return run(args, cfg);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
