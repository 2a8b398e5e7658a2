#include "ingest.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <thread>

Ingestor::Ingestor(const Chunker& chunker, EmbeddingService& embeddings, VectorStore& store)
  : chunker_(chunker), embeddings_(embeddings), store_(store) {}

IngestReport Ingestor::persist(const ChunkingResult& result, const std::string& document_id,
                               const std::string& source_file_name) {
  std::vector<std::string> texts;
  texts.reserve(result.chunks.size());
  for (auto& c : result.chunks) texts.push_back(c.content);
  auto emb = embeddings_.embed(texts);

  store_.replace_document(document_id, result.chunks, emb.vectors);

  IngestReport r;
  r.document_id = document_id;
  r.source_file_name = source_file_name;
  r.chunks = result.total_chunks;
  r.tokens = result.total_tokens;
  r.semantic_coherence = result.semantic_coherence;
  r.degraded = result.degraded || emb.degraded();
  if (r.degraded) spdlog::warn("{}: processed with reduced quality", document_id);
  return r;
}

IngestReport Ingestor::ingest_text(const std::string& text, const std::string& document_id,
                                   const SourceInfo& source, const ChunkingConfig& config) {
  auto result = chunker_.chunk_document(text, document_id, source, config);
  return persist(result, document_id, source.source_file_name);
}

IngestReport Ingestor::ingest_file(const std::string& path, const ChunkingConfig& config) {
  auto result = chunker_.chunk_file(path, config);
  return persist(result, path, std::filesystem::path(path).filename().string());
}

std::vector<IngestReport> Ingestor::ingest_folder(const std::string& root, const ChunkingConfig& config, int jobs) {
  config.validate();
  auto files = list_text_files(root);
  std::vector<std::optional<IngestReport>> slots(files.size());
  std::atomic<size_t> next{0};
  std::atomic<size_t> done{0};

  auto worker = [&] {
    for (size_t i = next++; i < files.size(); i = next++) {
      try {
        slots[i] = ingest_file(files[i], config);
      } catch (const std::exception& e) {
        spdlog::error("skipping {}: {}", files[i], e.what());
      }
      size_t n = ++done;
      if ((n % 50) == 0) spdlog::info("Indexed {} of {} files", n, files.size());
    }
  };

  int n_workers = std::max(1, std::min(jobs, (int)files.size()));
  if (n_workers == 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    for (int w = 0; w < n_workers; ++w) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
  }

  std::vector<IngestReport> reports;
  for (auto& s : slots)
    if (s) reports.push_back(std::move(*s));
  return reports;
}
