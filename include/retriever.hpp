#pragma once
#include "chunker.hpp"
#include "embedder.hpp"
#include "filters.hpp"
#include "vector_store.hpp"
#include <optional>
#include <string>
#include <vector>

enum class RetrievalStrategy { Semantic, Hierarchical, Hybrid, Contextual, Keyword };

const char* to_string(RetrievalStrategy s);
RetrievalStrategy retrieval_strategy_from_string(const std::string& s);   // throws std::invalid_argument

struct RetrievalOptions {
  int max_results = 10;
  double similarity_threshold = 0.5;
  bool include_context = false;
  int context_window = 0;         // 0: two for contextual retrieval, one otherwise
  ChunkFilter filter;             // document, type and level restrictions
};

// A stored chunk plus retrieval-time data; the chunk itself is never modified.
struct RetrievedChunk {
  DocumentChunk chunk;
  std::optional<double> similarity;
  std::vector<DocumentChunk> context;   // neighbours by position
};

struct AggregatedMetadata {
  std::vector<std::string> documents_covered;
  std::vector<std::string> heading_paths_covered;
  std::vector<int> hierarchy_levels;    // ascending
  std::optional<double> average_similarity;
};

struct RetrievalResult {
  std::vector<RetrievedChunk> chunks;
  size_t total_found = 0;
  RetrievalStrategy strategy = RetrievalStrategy::Hybrid;
  double processing_time_ms = 0.0;
  AggregatedMetadata aggregated_metadata;
  bool degraded = false;                // query embedded with the fallback
};

struct TocEntry {
  std::string title;
  int depth = 0;
  DocumentChunk heading;
  std::vector<DocumentChunk> content;   // filled when include_content is set
  std::vector<TocEntry> children;
};

struct TocOptions {
  std::optional<std::string> document_id;
  int max_depth = 0;                    // 0: unlimited
  bool include_content = false;
};

struct TableOfContents {
  std::vector<TocEntry> entries;
  size_t total_headings = 0;
};

struct RelatedOptions {
  int max_results = 10;
  bool include_siblings = true;
  bool include_parent_children = true;
  double similarity_threshold = 0.6;
};

std::vector<RetrievedChunk> deduplicate(const std::vector<RetrievedChunk>& chunks);
AggregatedMetadata aggregate_metadata(const std::vector<RetrievedChunk>& chunks);
bool is_heading_led(const DocumentChunk& c);

// Query strategies over one project's chunk corpus. Store failures give an
// empty result and are logged; they never escape.
class Retriever {
public:
  Retriever(const VectorStore& store, EmbeddingService& embeddings);

  RetrievalResult retrieve(const std::string& query,
                           RetrievalStrategy strategy = RetrievalStrategy::Hybrid,
                           const RetrievalOptions& options = RetrievalOptions{}) const;

  TableOfContents browse_by_structure(const TocOptions& options = TocOptions{}) const;

  // Siblings, parent and children, and semantic neighbours of a chunk.
  std::vector<RetrievedChunk> related_chunks(const std::string& chunk_id,
                                             const RelatedOptions& options = RelatedOptions{}) const;

private:
  RetrievalResult semantic(const std::string& query, const RetrievalOptions& options) const;
  RetrievalResult hierarchical(const std::string& query, const RetrievalOptions& options) const;
  RetrievalResult hybrid(const std::string& query, const RetrievalOptions& options) const;
  RetrievalResult contextual(const std::string& query, const RetrievalOptions& options) const;
  RetrievalResult keyword(const std::string& query, const RetrievalOptions& options) const;

  std::vector<DocumentChunk> adjacent(const DocumentChunk& c, int window) const;

  const VectorStore& store_;
  EmbeddingService& embeddings_;
};
