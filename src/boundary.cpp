#include "boundary.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>

const char* to_string(BoundaryType t) {
  switch (t) {
    case BoundaryType::Weak: return "weak";
    case BoundaryType::Moderate: return "moderate";
    case BoundaryType::Strong: return "strong";
  }
  return "weak";
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  size_t n = std::min(a.size(), b.size());
  double dot = 0, na = 0, nb = 0;
  for (size_t i = 0; i < n; ++i) {
    dot += (double)a[i] * b[i];
    na += (double)a[i] * a[i];
    nb += (double)b[i] * b[i];
  }
  if (na <= 0 || nb <= 0) return 0.0;
  double s = dot / (std::sqrt(na) * std::sqrt(nb));
  return std::min(1.0, std::max(0.0, s));
}

static bool topic_shift(const std::vector<std::string>& a, const std::vector<std::string>& b, double threshold) {
  std::unordered_set<std::string> sa(a.begin(), a.end());
  std::unordered_set<std::string> uni = sa;
  size_t inter = 0;
  for (auto& w : b) {
    if (sa.count(w)) ++inter;
    uni.insert(w);
  }
  if (uni.empty()) return false;
  return (double)inter / (double)uni.size() < threshold;
}

// Segments are cut here; also the split point candidates.
static bool is_cut(const SemanticBoundary& b) {
  return b.boundary_type == BoundaryType::Strong ||
         (b.boundary_type == BoundaryType::Moderate && b.topic_shift_detected);
}

BoundaryDetector::BoundaryDetector(EmbeddingService& embeddings, const Tokenizer& tokenizer,
                                   const BoundaryConfig& config)
  : embeddings_(embeddings), tokenizer_(tokenizer), config_(config) {}

double BoundaryDetector::similarity(const std::string& a, const std::string& b) const {
  auto res = embeddings_.embed({a, b});
  return cosine_similarity(res.vectors[0], res.vectors[1]);
}

SemanticAnalysis BoundaryDetector::analyze(const std::vector<HierarchyNode>& nodes) const {
  SemanticAnalysis out;

  std::vector<std::string> units, bodies;
  for (auto& n : nodes) {
    if (trim(n.content).empty()) continue;
    std::string prefix = n.path.empty() ? "" : "[" + join(n.path, " > ") + "] ";
    units.push_back(prefix + n.content);
    bodies.push_back(n.content);
    out.unit_positions.push_back(n.position);
  }
  if (units.empty()) return out;

  auto emb = embeddings_.embed(units);
  out.degraded = emb.degraded();
  const auto& vecs = emb.vectors;
  const int n = (int)units.size();

  std::vector<std::vector<std::string>> keywords;
  keywords.reserve(n);
  for (auto& b : bodies) keywords.push_back(extract_keywords(b, 5));

  for (int i = 0; i + 1 < n; ++i) out.similarities.push_back(cosine_similarity(vecs[i], vecs[i+1]));

  // boundaries
  const int w = config_.window_size;
  const int m = (int)out.similarities.size();
  for (int i = 0; i < m; ++i) {
    double sim = out.similarities[i];
    double sum = 0; int cnt = 0;
    for (int j = std::max(0, i - w); j <= std::min(m - 1, i + w); ++j) {
      if (j == i) continue;
      sum += out.similarities[j]; ++cnt;
    }
    double local = cnt ? sum / cnt : sim;

    SemanticBoundary b;
    b.position = out.unit_positions[i+1];
    b.similarity_drop = 1.0 - sim;
    b.boundary_strength = local > 0 ? std::min(1.0, std::max(0.0, (local - sim) / local)) : 0.0;
    b.topic_shift_detected = topic_shift(keywords[i], keywords[i+1], config_.topic_overlap_threshold);
    if (sim < config_.similarity_threshold * 0.5) b.boundary_type = BoundaryType::Strong;
    else if (sim < config_.similarity_threshold) b.boundary_type = BoundaryType::Moderate;
    else b.boundary_type = BoundaryType::Weak;
    out.boundaries.push_back(b);
  }

  // segments
  auto close_segment = [&](int begin, int end) {
    SemanticSegment s;
    s.id = "segment_" + std::to_string(out.segments.size() + 1);
    s.start_position = out.unit_positions[begin];
    s.end_position = out.unit_positions[end-1] + 1;
    std::vector<std::string> parts(bodies.begin() + begin, bodies.begin() + end);
    s.content = join(parts, "\n\n");
    s.topic_keywords = extract_keywords(s.content, 5);

    if (end - begin > 1) {
      double sum = 0; int cnt = 0;
      for (int a = begin; a < end; ++a)
        for (int c = a + 1; c < end; ++c) { sum += cosine_similarity(vecs[a], vecs[c]); ++cnt; }
      s.coherence_score = sum / cnt;
    }
    s.embedding.assign(vecs[begin].size(), 0.0f);
    for (int a = begin; a < end; ++a)
      for (size_t d = 0; d < s.embedding.size() && d < vecs[a].size(); ++d) s.embedding[d] += vecs[a][d];
    for (auto& x : s.embedding) x /= (float)(end - begin);
    out.segments.push_back(std::move(s));
  };

  int begin = 0;
  for (int i = 0; i < m; ++i) {
    if (is_cut(out.boundaries[i])) { close_segment(begin, i + 1); begin = i + 1; }
  }
  close_segment(begin, n);

  for (size_t i = 0; i + 1 < out.segments.size(); ++i) {
    double s = cosine_similarity(out.segments[i].embedding, out.segments[i+1].embedding);
    out.segments[i].similarity_to_next = s;
    out.segments[i+1].similarity_to_previous = s;
  }

  if (out.similarities.empty()) {
    out.overall_coherence = 1.0;
  } else {
    double sum = 0;
    for (double s : out.similarities) sum += s;
    out.overall_coherence = sum / out.similarities.size();
  }

  // split points: strong enough, with enough text since the previous split
  int accumulated = count_tokens(tokenizer_, bodies[0]);
  for (int i = 0; i < m; ++i) {
    if (is_cut(out.boundaries[i]) && accumulated >= config_.min_segment_tokens) {
      out.recommended_split_points.push_back(out.boundaries[i].position);
      accumulated = 0;
    }
    accumulated += count_tokens(tokenizer_, bodies[i+1]);
  }
  return out;
}
