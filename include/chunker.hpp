#pragma once
#include "boundary.hpp"
#include "structure.hpp"
#include "tokenizer.hpp"
#include <stdexcept>
#include <string>
#include <vector>

enum class ChunkType { Heading, Paragraph, List, Table, Code, Mixed };
enum class ChunkingMethod { Structural, Semantic, Hybrid };

const char* to_string(ChunkType t);
const char* to_string(ChunkingMethod m);
ChunkType chunk_type_from_string(const std::string& s);          // throws std::invalid_argument
ChunkingMethod chunking_method_from_string(const std::string& s);

// Rejected configuration, raised before any work starts.
struct ConfigError : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

struct ChunkingConfig {
  int min_chunk_size = 200;       // tokens
  int max_chunk_size = 500;
  int target_chunk_size = 400;
  double overlap_percentage = 10.0;
  bool prefer_semantic_boundaries = true;
  bool respect_section_boundaries = true;
  bool include_heading_context = true;

  void validate() const;
  // Sizes scaled down for documents shorter than four max-size chunks.
  ChunkingConfig adapted_for(int total_tokens) const;
};

struct SourceInfo {
  std::string source_file_id;
  std::string source_file_name;
};

struct ChunkProvenance {
  std::string source_file_id;
  std::string source_file_name;
  ChunkingMethod chunking_method = ChunkingMethod::Hybrid;
  std::string created_at;         // ISO-8601 UTC
};

struct DocumentChunk {
  std::string id;                 // <document_id>#<position>
  std::string document_id;
  std::string content;
  int tokens = 0;
  int position = 0;
  std::vector<std::string> heading_path;
  int hierarchy_level = 0;
  std::string parent_section_id;  // empty when top level
  ChunkType chunk_type = ChunkType::Paragraph;
  double semantic_density = 1.0;
  std::vector<std::string> topic_keywords;
  bool has_overlap_previous = false;
  bool has_overlap_next = false;
  std::string overlap_text;
  std::string previous_chunk_id;
  std::string next_chunk_id;
  std::vector<std::string> sibling_chunk_ids;
  std::vector<std::string> child_chunk_ids;
  ChunkProvenance provenance;
};

struct ChunkingResult {
  std::vector<DocumentChunk> chunks;
  size_t total_chunks = 0;
  int total_tokens = 0;
  double average_chunk_size = 0.0;
  double overlap_efficiency = 0.0;
  double semantic_coherence = 0.0;
  double hierarchy_preservation = 0.0;
  bool degraded = false;          // fallback embeddings were used
  ChunkingConfig effective_config;
};

class Chunker {
public:
  Chunker(const Tokenizer& tokenizer, const BoundaryDetector& detector);

  // Throws ConfigError for an invalid config; otherwise always returns.
  ChunkingResult chunk_document(const std::string& text,
                                const std::string& document_id,
                                const SourceInfo& source,
                                const ChunkingConfig& config = ChunkingConfig{}) const;

  // Reads path and chunks it with the path as document id.
  ChunkingResult chunk_file(const std::string& path, const ChunkingConfig& config = ChunkingConfig{}) const;

private:
  const Tokenizer& tokenizer_;
  const BoundaryDetector& detector_;
  StructureParser parser_;
};

std::vector<std::string> list_text_files(const std::string& root);
std::string read_text_file(const std::string& path);   // throws std::runtime_error
