#pragma once
#include "chunker.hpp"
#include "embedder.hpp"
#include "vector_store.hpp"
#include <string>
#include <vector>

struct IngestReport {
  std::string document_id;
  std::string source_file_name;
  size_t chunks = 0;
  int tokens = 0;
  double semantic_coherence = 0.0;
  bool degraded = false;   // fallback embeddings somewhere in the pipeline
};

// Chunk -> embed -> persist. A document is written in one transaction, so a
// failure part way leaves its previous version untouched.
class Ingestor {
public:
  Ingestor(const Chunker& chunker, EmbeddingService& embeddings, VectorStore& store);

  IngestReport ingest_text(const std::string& text, const std::string& document_id,
                           const SourceInfo& source, const ChunkingConfig& config);
  IngestReport ingest_file(const std::string& path, const ChunkingConfig& config);
  // Files that fail are logged and skipped; reports keep file order.
  std::vector<IngestReport> ingest_folder(const std::string& root, const ChunkingConfig& config, int jobs = 1);

private:
  IngestReport persist(const ChunkingResult& result, const std::string& document_id,
                       const std::string& source_file_name);

  const Chunker& chunker_;
  EmbeddingService& embeddings_;
  VectorStore& store_;
};
