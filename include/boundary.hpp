#pragma once
#include "embedder.hpp"
#include "structure.hpp"
#include "tokenizer.hpp"
#include <optional>
#include <string>
#include <vector>

enum class BoundaryType { Weak, Moderate, Strong };

const char* to_string(BoundaryType t);

// Boundary between the unit at position-1 and the unit at position
// (positions are node positions).
struct SemanticBoundary {
  int position = 0;
  double boundary_strength = 0.0;   // [0,1]
  double similarity_drop = 0.0;     // 1 - similarity
  bool topic_shift_detected = false;
  BoundaryType boundary_type = BoundaryType::Weak;
};

struct SemanticSegment {
  std::string id;
  int start_position = 0;
  int end_position = 0;             // exclusive
  std::string content;
  double coherence_score = 1.0;
  std::vector<std::string> topic_keywords;
  std::vector<float> embedding;     // mean of member embeddings
  std::optional<double> similarity_to_previous;
  std::optional<double> similarity_to_next;
};

struct SemanticAnalysis {
  std::vector<SemanticSegment> segments;
  std::vector<SemanticBoundary> boundaries;
  double overall_coherence = 0.0;
  std::vector<int> recommended_split_points;
  std::vector<int> unit_positions;   // node position of each unit
  std::vector<double> similarities;  // similarities[i]: unit i vs unit i+1
  bool degraded = false;
};

struct BoundaryConfig {
  double similarity_threshold = 0.7;
  int window_size = 3;
  int min_segment_tokens = 100;
  double topic_overlap_threshold = 0.3;
};

// Cosine similarity clamped to [0,1]; 0 when either vector has zero norm.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

class BoundaryDetector {
public:
  BoundaryDetector(EmbeddingService& embeddings, const Tokenizer& tokenizer,
                   const BoundaryConfig& config = BoundaryConfig{});

  SemanticAnalysis analyze(const std::vector<HierarchyNode>& nodes) const;

  // Similarity of two free texts, through the same embedding path.
  double similarity(const std::string& a, const std::string& b) const;

  const BoundaryConfig& config() const { return config_; }

private:
  EmbeddingService& embeddings_;
  const Tokenizer& tokenizer_;
  BoundaryConfig config_;
};
