#include "retriever.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_set>

const char* to_string(RetrievalStrategy s) {
  switch (s) {
    case RetrievalStrategy::Semantic: return "semantic";
    case RetrievalStrategy::Hierarchical: return "hierarchical";
    case RetrievalStrategy::Hybrid: return "hybrid";
    case RetrievalStrategy::Contextual: return "contextual";
    case RetrievalStrategy::Keyword: return "keyword";
  }
  return "hybrid";
}

RetrievalStrategy retrieval_strategy_from_string(const std::string& s) {
  for (RetrievalStrategy r : {RetrievalStrategy::Semantic, RetrievalStrategy::Hierarchical,
                              RetrievalStrategy::Hybrid, RetrievalStrategy::Contextual,
                              RetrievalStrategy::Keyword})
    if (s == to_string(r)) return r;
  throw std::invalid_argument("unknown retrieval strategy: " + s);
}

std::vector<RetrievedChunk> deduplicate(const std::vector<RetrievedChunk>& chunks) {
  std::unordered_set<std::string> seen;
  std::vector<RetrievedChunk> out;
  for (auto& c : chunks)
    if (seen.insert(c.chunk.id).second) out.push_back(c);
  return out;
}

AggregatedMetadata aggregate_metadata(const std::vector<RetrievedChunk>& chunks) {
  AggregatedMetadata m;
  std::unordered_set<std::string> docs, paths;
  double sim_sum = 0; int sim_n = 0;
  for (auto& r : chunks) {
    if (docs.insert(r.chunk.document_id).second) m.documents_covered.push_back(r.chunk.document_id);
    auto p = join(r.chunk.heading_path, " > ");
    if (paths.insert(p).second) m.heading_paths_covered.push_back(p);
    if (std::find(m.hierarchy_levels.begin(), m.hierarchy_levels.end(), r.chunk.hierarchy_level) ==
        m.hierarchy_levels.end())
      m.hierarchy_levels.push_back(r.chunk.hierarchy_level);
    if (r.similarity) { sim_sum += *r.similarity; ++sim_n; }
  }
  std::sort(m.hierarchy_levels.begin(), m.hierarchy_levels.end());
  if (sim_n) m.average_similarity = sim_sum / sim_n;
  return m;
}

bool is_heading_led(const DocumentChunk& c) {
  return c.chunk_type == ChunkType::Heading || starts_with(trim(c.content), "#");
}

static RetrievalResult make_result(std::vector<RetrievedChunk> chunks, size_t total_found) {
  RetrievalResult r;
  r.total_found = total_found;
  r.aggregated_metadata = aggregate_metadata(chunks);
  r.chunks = std::move(chunks);
  return r;
}

static int ceil_share(int n, double share) { return (int)std::ceil(n * share); }

Retriever::Retriever(const VectorStore& store, EmbeddingService& embeddings)
  : store_(store), embeddings_(embeddings) {}

RetrievalResult Retriever::retrieve(const std::string& query, RetrievalStrategy strategy,
                                    const RetrievalOptions& options) const {
  auto t0 = std::chrono::steady_clock::now();
  RetrievalResult result;
  try {
    switch (strategy) {
      case RetrievalStrategy::Semantic: result = semantic(query, options); break;
      case RetrievalStrategy::Hierarchical: result = hierarchical(query, options); break;
      case RetrievalStrategy::Hybrid: result = hybrid(query, options); break;
      case RetrievalStrategy::Contextual: result = contextual(query, options); break;
      case RetrievalStrategy::Keyword: result = keyword(query, options); break;
    }
  } catch (const std::exception& e) {
    spdlog::error("{} retrieval failed: {}", to_string(strategy), e.what());
    result = RetrievalResult{};
  }
  result.strategy = strategy;
  result.processing_time_ms =
    std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  return result;
}

std::vector<DocumentChunk> Retriever::adjacent(const DocumentChunk& c, int window) const {
  ChunkFilter f;
  f.document_id = c.document_id;
  f.position_from = c.position - window;
  f.position_to = c.position + window;
  std::vector<DocumentChunk> out;
  for (auto& n : store_.get_by_filter(f))
    if (n.id != c.id) out.push_back(std::move(n));
  return out;
}

RetrievalResult Retriever::semantic(const std::string& query, const RetrievalOptions& options) const {
  auto q = embeddings_.embed_query(query);
  std::vector<RetrievedChunk> chunks;
  for (auto& h : store_.query(q.vectors[0], options.max_results, options.filter)) {
    double sim = std::min(1.0, std::max(0.0, 1.0 - h.distance));
    if (sim < options.similarity_threshold) continue;
    chunks.push_back(RetrievedChunk{std::move(h.chunk), sim, {}});
  }
  if (options.include_context) {
    int window = options.context_window > 0 ? options.context_window : 1;
    for (auto& r : chunks) r.context = adjacent(r.chunk, window);
  }
  size_t n = chunks.size();
  auto r = make_result(std::move(chunks), n);
  r.degraded = q.degraded();
  return r;
}

RetrievalResult Retriever::hierarchical(const std::string& query, const RetrievalOptions& options) const {
  auto hints = parse_hierarchical_query(query);
  if (hints.empty()) return make_result({}, 0);

  int fetch = std::max(50, options.max_results);
  std::vector<RetrievedChunk> found;
  if (hints.heading) {
    ChunkFilter f = options.filter;
    f.heading_contains = hints.heading;
    for (auto& c : store_.get_by_filter(f, fetch)) found.push_back(RetrievedChunk{std::move(c), {}, {}});
  }
  if (hints.level) {
    ChunkFilter f = options.filter;
    f.hierarchy_level = hints.level;
    for (auto& c : store_.get_by_filter(f, fetch)) found.push_back(RetrievedChunk{std::move(c), {}, {}});
  }

  auto unique = deduplicate(found);
  std::stable_sort(unique.begin(), unique.end(), [](const RetrievedChunk& a, const RetrievedChunk& b) {
    if (a.chunk.hierarchy_level != b.chunk.hierarchy_level) return a.chunk.hierarchy_level < b.chunk.hierarchy_level;
    if (a.chunk.position != b.chunk.position) return a.chunk.position < b.chunk.position;
    return a.chunk.document_id < b.chunk.document_id;
  });
  size_t total = unique.size();
  if ((int)unique.size() > options.max_results) unique.resize((size_t)std::max(0, options.max_results));
  if (options.include_context) {
    int window = options.context_window > 0 ? options.context_window : 1;
    for (auto& r : unique) r.context = adjacent(r.chunk, window);
  }
  return make_result(std::move(unique), total);
}

RetrievalResult Retriever::hybrid(const std::string& query, const RetrievalOptions& options) const {
  RetrievalOptions sem_opts = options;
  sem_opts.max_results = ceil_share(options.max_results, 0.7);
  RetrievalOptions hier_opts = options;
  hier_opts.max_results = ceil_share(options.max_results, 0.3);

  auto sem = semantic(query, sem_opts);
  auto hier = hierarchical(query, hier_opts);

  std::vector<RetrievedChunk> combined = sem.chunks;
  combined.insert(combined.end(), hier.chunks.begin(), hier.chunks.end());
  auto unique = deduplicate(combined);

  auto score = [](const RetrievedChunk& r) {
    return r.similarity.value_or(0.0) * 0.7 +
           (r.chunk.hierarchy_level == 1 ? 0.3 : 0.0) +
           (r.chunk.chunk_type == ChunkType::Heading ? 0.2 : 0.0);
  };
  std::stable_sort(unique.begin(), unique.end(), [&](const RetrievedChunk& a, const RetrievedChunk& b) {
    return score(a) > score(b);
  });
  size_t total = unique.size();
  if ((int)unique.size() > options.max_results) unique.resize((size_t)std::max(0, options.max_results));
  auto r = make_result(std::move(unique), total);
  r.degraded = sem.degraded;
  return r;
}

RetrievalResult Retriever::contextual(const std::string& query, const RetrievalOptions& options) const {
  RetrievalOptions base = options;
  base.include_context = false;
  auto sem = semantic(query, base);
  int window = options.context_window > 0 ? options.context_window : 2;
  for (auto& r : sem.chunks) r.context = adjacent(r.chunk, window);
  sem.total_found = sem.chunks.size();
  return sem;
}

RetrievalResult Retriever::keyword(const std::string& query, const RetrievalOptions& options) const {
  auto kws = query_keywords(query);
  if (kws.empty()) return make_result({}, 0);

  struct Scored { DocumentChunk chunk; KeywordScore score; };
  std::vector<Scored> matched;
  for (auto& c : store_.get_by_filter(options.filter)) {
    auto s = score_keywords(c, query, kws);
    if (s.match == KeywordMatch::None) continue;
    matched.push_back(Scored{std::move(c), s});
  }
  std::stable_sort(matched.begin(), matched.end(), [](const Scored& a, const Scored& b) {
    if (a.score.match != b.score.match) return a.score.match > b.score.match;
    if (a.score.hits != b.score.hits) return a.score.hits > b.score.hits;
    if (a.chunk.document_id != b.chunk.document_id) return a.chunk.document_id < b.chunk.document_id;
    return a.chunk.position < b.chunk.position;
  });

  size_t total = matched.size();
  std::vector<RetrievedChunk> chunks;
  for (auto& m : matched) {
    if ((int)chunks.size() >= options.max_results) break;
    chunks.push_back(RetrievedChunk{std::move(m.chunk), {}, {}});
  }
  if (options.include_context) {
    int window = options.context_window > 0 ? options.context_window : 1;
    for (auto& r : chunks) r.context = adjacent(r.chunk, window);
  }
  return make_result(std::move(chunks), total);
}

static std::string toc_title(const DocumentChunk& c) {
  std::string first = trim(c.content.substr(0, c.content.find('\n')));
  size_t i = 0;
  while (i < first.size() && first[i] == '#') ++i;
  std::string title = trim(first.substr(i));
  if (title.empty() && !c.heading_path.empty()) title = c.heading_path.back();
  return title;
}

TableOfContents Retriever::browse_by_structure(const TocOptions& options) const {
  TableOfContents toc;
  try {
    ChunkFilter f;
    f.document_id = options.document_id;
    auto all = store_.get_by_filter(f);

    std::vector<TocEntry*> stack;
    std::string current_doc;
    TocEntry* open = nullptr;   // entry collecting content chunks
    for (auto& c : all) {
      if (c.document_id != current_doc) {
        current_doc = c.document_id;
        stack.clear();
        open = nullptr;
      }
      if (!is_heading_led(c)) {
        if (open && options.include_content) open->content.push_back(c);
        continue;
      }
      int depth = std::max(1, c.hierarchy_level);
      if (options.max_depth > 0 && depth > options.max_depth) {
        open = nullptr;
        continue;
      }

      TocEntry e;
      e.title = toc_title(c);
      e.depth = depth;
      e.heading = c;
      while (!stack.empty() && stack.back()->depth >= depth) stack.pop_back();
      auto& siblings = stack.empty() ? toc.entries : stack.back()->children;
      siblings.push_back(std::move(e));
      stack.push_back(&siblings.back());
      open = stack.back();
      ++toc.total_headings;
    }
  } catch (const std::exception& e) {
    spdlog::error("browse by structure failed: {}", e.what());
    return TableOfContents{};
  }
  return toc;
}

std::vector<RetrievedChunk> Retriever::related_chunks(const std::string& chunk_id,
                                                      const RelatedOptions& options) const {
  std::vector<RetrievedChunk> related;
  try {
    auto src = store_.get(chunk_id);
    if (!src) return {};

    auto add = [&](const std::string& id) {
      if (id.empty()) return;
      if (auto c = store_.get(id)) related.push_back(RetrievedChunk{std::move(*c), {}, {}});
    };
    if (options.include_siblings) {
      size_t n = std::min<size_t>(5, src->sibling_chunk_ids.size());
      for (size_t i = 0; i < n; ++i) add(src->sibling_chunk_ids[i]);
    }
    if (options.include_parent_children) {
      add(src->parent_section_id);
      for (auto& id : src->child_chunk_ids) add(id);
    }

    auto q = embeddings_.embed_query(src->content);
    for (auto& h : store_.query(q.vectors[0], options.max_results + 1)) {
      double sim = std::min(1.0, std::max(0.0, 1.0 - h.distance));
      if (sim < options.similarity_threshold) continue;
      related.push_back(RetrievedChunk{std::move(h.chunk), sim, {}});
    }
  } catch (const std::exception& e) {
    spdlog::error("related chunks for {} failed: {}", chunk_id, e.what());
    return {};
  }

  std::vector<RetrievedChunk> out;
  for (auto& r : deduplicate(related)) {
    if (r.chunk.id == chunk_id) continue;
    if ((int)out.size() >= options.max_results) break;
    out.push_back(std::move(r));
  }
  return out;
}
