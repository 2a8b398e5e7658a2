#include "chunker.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>

using std::string;
namespace fs = std::filesystem;

// ---------------------------------------------------------------- enums

const char* to_string(ChunkType t) {
  switch (t) {
    case ChunkType::Heading: return "heading";
    case ChunkType::Paragraph: return "paragraph";
    case ChunkType::List: return "list";
    case ChunkType::Table: return "table";
    case ChunkType::Code: return "code";
    case ChunkType::Mixed: return "mixed";
  }
  return "mixed";
}

const char* to_string(ChunkingMethod m) {
  switch (m) {
    case ChunkingMethod::Structural: return "structural";
    case ChunkingMethod::Semantic: return "semantic";
    case ChunkingMethod::Hybrid: return "hybrid";
  }
  return "hybrid";
}

ChunkType chunk_type_from_string(const string& s) {
  for (ChunkType t : {ChunkType::Heading, ChunkType::Paragraph, ChunkType::List,
                      ChunkType::Table, ChunkType::Code, ChunkType::Mixed})
    if (s == to_string(t)) return t;
  throw std::invalid_argument("unknown chunk type: " + s);
}

ChunkingMethod chunking_method_from_string(const string& s) {
  for (ChunkingMethod m : {ChunkingMethod::Structural, ChunkingMethod::Semantic, ChunkingMethod::Hybrid})
    if (s == to_string(m)) return m;
  throw std::invalid_argument("unknown chunking method: " + s);
}

// ---------------------------------------------------------------- config

void ChunkingConfig::validate() const {
  if (min_chunk_size <= 0)
    throw ConfigError("min_chunk_size must be positive, got " + std::to_string(min_chunk_size));
  if (min_chunk_size > max_chunk_size)
    throw ConfigError("min_chunk_size (" + std::to_string(min_chunk_size) +
                      ") exceeds max_chunk_size (" + std::to_string(max_chunk_size) + ")");
  if (target_chunk_size < min_chunk_size || target_chunk_size > max_chunk_size)
    throw ConfigError("target_chunk_size must lie in [min_chunk_size, max_chunk_size], got " +
                      std::to_string(target_chunk_size));
  if (overlap_percentage < 0.0 || overlap_percentage >= 100.0)
    throw ConfigError("overlap_percentage must lie in [0, 100)");
}

ChunkingConfig ChunkingConfig::adapted_for(int total_tokens) const {
  ChunkingConfig c = *this;
  if (total_tokens >= 4 * max_chunk_size) return c;
  double scale = std::max(0.25, (double)total_tokens / (4.0 * max_chunk_size));
  c.min_chunk_size = std::max(1, (int)std::lround(min_chunk_size * scale));
  c.max_chunk_size = std::max(c.min_chunk_size, (int)std::lround(max_chunk_size * scale));
  c.target_chunk_size = std::min(c.max_chunk_size,
                                 std::max(c.min_chunk_size, (int)std::lround(target_chunk_size * scale)));
  return c;
}

// ---------------------------------------------------------------- files

static bool is_text_ext(const string& ext) {
  static const char* bad[] = {".png",".jpg",".jpeg",".gif",".tif",".tiff",".pdf",".zip",".gz",
                              ".mp4",".mov",".mp3",".wav",".ogg",".bin",".so",".dll",".gguf",
                              ".hnsw",".sqlite",".db"};
  for (auto* b : bad) if (ext == b) return false;
  return true;
}

std::vector<std::string> list_text_files(const std::string& root) {
  std::vector<string> out;
  for (auto& p : fs::recursive_directory_iterator(root)) {
    if (!p.is_regular_file()) continue;
    auto ext = to_lower(p.path().extension().string());
    if (!is_text_ext(ext)) continue;
    out.push_back(p.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("chunker: cannot read " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

// ---------------------------------------------------------------- chunking

namespace {

// A chunk under construction. Node positions bound the span it covers.
struct Draft {
  string content;
  int tokens = 0;
  ChunkType type = ChunkType::Paragraph;
  std::vector<string> heading_path;
  int level = 0;
  int section = -1;            // tree index of the top-level heading, -1 before any heading
  int first_node = 0;
  int last_node = 0;
  std::vector<string> keywords;
  double density = 1.0;
  bool heading_led = false;
};

struct TreeNode {
  int node = -1;               // arena index, -1 for the document root
  int depth = 0;               // corrected heading depth
  int section = -1;
  std::vector<int> children;
};

ChunkType chunk_type_of(NodeType t) {
  switch (t) {
    case NodeType::Heading: return ChunkType::Heading;
    case NodeType::List: return ChunkType::List;
    case NodeType::Table: return ChunkType::Table;
    case NodeType::Code: return ChunkType::Code;
    case NodeType::Paragraph:
    case NodeType::Text: return ChunkType::Paragraph;
  }
  return ChunkType::Paragraph;
}

std::vector<string> union_keywords(const std::vector<string>& a, const std::vector<string>& b) {
  std::vector<string> out = a;
  for (auto& w : b)
    if (std::find(out.begin(), out.end(), w) == out.end()) out.push_back(w);
  return out;
}

bool paths_related(const std::vector<string>& a, const std::vector<string>& b) {
  size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i)
    if (a[i] != b[i]) return i > 0;
  return true;
}

class DocumentRun {
public:
  DocumentRun(const Tokenizer& tok, const DocumentStructure& doc,
              const SemanticAnalysis& analysis, const ChunkingConfig& cfg)
    : tok_(tok), doc_(doc), analysis_(analysis), cfg_(cfg) {
    for (size_t u = 0; u < analysis.unit_positions.size(); ++u) unit_of_[analysis.unit_positions[u]] = (int)u;
    for (auto& b : analysis.boundaries) strength_at_[b.position] = b.boundary_strength;
    build_tree();
  }

  std::vector<Draft> run() {
    // post-order over the tree; each subtree yields its own draft list
    std::vector<std::vector<Draft>> results(tree_.size());
    std::vector<int> order;
    std::vector<int> stack{0};
    while (!stack.empty()) {
      int t = stack.back(); stack.pop_back();
      order.push_back(t);
      for (int c : tree_[t].children) stack.push_back(c);
    }
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
      int t = *it;
      results[t] = process(t, results);
      for (int c : tree_[t].children) results[c].clear();
    }
    return rebalance(results[0]);
  }

  int tokens(const string& s) const { return count_tokens(tok_, s); }

private:
  void build_tree() {
    tree_.resize(doc_.nodes.size() + 1);
    node_text_.resize(doc_.nodes.size());
    node_tokens_.resize(doc_.nodes.size());
    for (size_t i = 0; i < doc_.nodes.size(); ++i) {
      const HierarchyNode& n = doc_.nodes[i];
      int idx = (int)i + 1;
      int parent = n.parent ? (int)*n.parent + 1 : 0;
      TreeNode& t = tree_[idx];
      t.node = (int)i;
      if (n.type == NodeType::Heading) {
        t.depth = tree_[parent].depth + 1;
        t.section = parent == 0 ? idx : tree_[parent].section;
        node_text_[i] = string((size_t)t.depth, '#') + " " + n.content;
      } else {
        t.depth = tree_[parent].depth;
        t.section = tree_[parent].section;
        node_text_[i] = n.content;
      }
      node_tokens_[i] = tokens(node_text_[i]);
      tree_[parent].children.push_back(idx);
    }
    subtree_tokens_.assign(tree_.size(), 0);
    for (int t = (int)tree_.size() - 1; t > 0; --t) {
      subtree_tokens_[t] += node_tokens_[tree_[t].node];
      int parent = doc_.nodes[tree_[t].node].parent ? (int)*doc_.nodes[tree_[t].node].parent + 1 : 0;
      subtree_tokens_[parent] += subtree_tokens_[t];
    }
  }

  bool is_heading(int t) const {
    return tree_[t].node >= 0 && doc_.nodes[tree_[t].node].type == NodeType::Heading;
  }

  // Mean adjacent similarity over the units in [first, last].
  double range_density(int first, int last) const {
    auto a = unit_of_.find(first), b = unit_of_.find(last);
    if (a == unit_of_.end() || b == unit_of_.end() || b->second <= a->second) return 1.0;
    double sum = 0;
    for (int u = a->second; u < b->second; ++u) sum += analysis_.similarities[u];
    return std::min(1.0, std::max(0.0, sum / (b->second - a->second)));
  }

  Draft leaf(int t) const {
    const TreeNode& tn = tree_[t];
    const HierarchyNode& n = doc_.nodes[tn.node];
    Draft d;
    d.content = node_text_[tn.node];
    d.tokens = node_tokens_[tn.node];
    d.type = chunk_type_of(n.type);
    d.heading_path = n.path;
    d.heading_led = n.type == NodeType::Heading;
    if (d.heading_led) d.heading_path.push_back(n.content);
    d.level = tn.depth;
    d.section = tn.section;
    d.first_node = d.last_node = n.position;
    d.keywords = extract_keywords(d.content, 5);
    return d;
  }

  Draft with_content(const Draft& proto, const string& content) const {
    Draft d = proto;
    d.content = content;
    d.tokens = tokens(content);
    d.keywords = extract_keywords(content, 5);
    return d;
  }

  // Halve a single over-long word until every piece fits.
  void split_word(const string& w, std::vector<string>& out) const {
    if (w.size() < 2 || tokens(w) <= cfg_.max_chunk_size) { out.push_back(w); return; }
    size_t mid = w.size() / 2;
    while (mid > 1 && ((unsigned char)w[mid] & 0xC0) == 0x80) --mid;   // stay on a UTF-8 boundary
    split_word(w.substr(0, mid), out);
    split_word(w.substr(mid), out);
  }

  // Pieces of at most max tokens, packed towards target.
  std::vector<Draft> split_oversized(const Draft& d) const {
    if (d.tokens <= cfg_.max_chunk_size) return {d};

    bool by_line = d.type == ChunkType::List || d.type == ChunkType::Table || d.type == ChunkType::Code;
    std::vector<string> units = by_line ? split_lines(d.content) : split_sentences(d.content);
    const string sep = by_line ? "\n" : " ";

    std::vector<std::pair<string, int>> sized;
    for (auto& u : units) {
      int n = tokens(u);
      if (n <= cfg_.max_chunk_size) { sized.emplace_back(u, n); continue; }
      // word windows
      string cur; int cur_n = 0;
      std::vector<string> words;
      for (auto& w : split_words(u)) split_word(w, words);
      for (auto& w : words) {
        string next = cur.empty() ? w : cur + " " + w;
        int next_n = tokens(next);
        if (!cur.empty() && next_n > cfg_.max_chunk_size) {
          sized.emplace_back(cur, cur_n);
          next = w;
          next_n = tokens(w);
        }
        cur = std::move(next);
        cur_n = next_n;
      }
      if (!cur.empty()) sized.emplace_back(cur, cur_n);
    }

    std::vector<string> pieces;
    string cur; int cur_n = 0;
    for (auto& s : sized) {
      if (cur.empty()) { cur = s.first; cur_n = s.second; continue; }
      string next = cur + sep + s.first;
      int next_n = tokens(next);
      if (cur_n + s.second > cfg_.target_chunk_size || next_n > cfg_.max_chunk_size) {
        pieces.push_back(cur);
        cur = s.first;
        cur_n = s.second;
      } else {
        cur = std::move(next);
        cur_n = next_n;
      }
    }
    if (!cur.empty()) pieces.push_back(cur);

    // fold a short tail back into its predecessor when it fits
    if (pieces.size() >= 2) {
      int last = tokens(pieces.back());
      string joined = pieces[pieces.size() - 2] + sep + pieces.back();
      if (last < cfg_.min_chunk_size && tokens(joined) <= cfg_.max_chunk_size) {
        pieces.pop_back();
        pieces.back() = joined;
      }
    }

    std::vector<Draft> out;
    for (size_t i = 0; i < pieces.size(); ++i) {
      Draft p = with_content(d, pieces[i]);
      p.heading_led = d.heading_led && i == 0;
      out.push_back(std::move(p));
    }
    return out;
  }

  // Consecutive fragments joined; keeps the covered span and a type per fragment.
  Draft combine(const Draft& a, const Draft& b) const {
    Draft d = a;
    d.content = a.content + "\n\n" + b.content;
    d.tokens = tokens(d.content);
    d.type = a.type == b.type ? a.type : ChunkType::Mixed;
    d.keywords = union_keywords(a.keywords, b.keywords);
    d.last_node = b.last_node;
    d.density = range_density(d.first_node, d.last_node);
    return d;
  }

  // The joined text can count more than its parts (separator, special tokens).
  bool fits_together(const Draft& a, const Draft& b) const {
    if (a.tokens + b.tokens > cfg_.max_chunk_size) return false;
    return tokens(a.content + "\n\n" + b.content) <= cfg_.max_chunk_size;
  }

  void flush_fragments(std::vector<int>& frag, std::vector<Draft>& out) const {
    if (frag.empty()) return;
    Draft cur = leaf(frag[0]);
    for (size_t i = 1; i < frag.size(); ++i) {
      Draft next = leaf(frag[i]);
      if (fits_together(cur, next)) cur = combine(cur, next);
      else { out.push_back(cur); cur = next; }
    }
    out.push_back(cur);
    frag.clear();
  }

  bool can_join(const Draft& a, const Draft& b) const {
    if (cfg_.respect_section_boundaries && a.section != b.section) return false;
    if (cfg_.prefer_semantic_boundaries) {
      for (int p = a.last_node + 1; p <= b.first_node; ++p) {
        auto it = strength_at_.find(p);
        if (it != strength_at_.end() && it->second > 0.8) return false;
      }
    }
    return true;
  }

  bool related(const Draft& a, const Draft& b) const {
    if (a.type == ChunkType::Heading && b.type != ChunkType::Heading) return true;
    return a.level != 0 && a.level == b.level;
  }

  bool can_merge(const Draft& a, const Draft& b) const {
    if (!can_join(a, b) || !fits_together(a, b)) return false;
    bool small = a.tokens < cfg_.min_chunk_size || b.tokens < cfg_.min_chunk_size;
    bool code = a.type == ChunkType::Code && b.type == ChunkType::Code;
    return small || code || related(a, b);
  }

  Draft merge(const Draft& a, const Draft& b) const {
    Draft d = a;
    d.content = a.content + "\n\n" + b.content;
    d.tokens = tokens(d.content);
    d.type = ChunkType::Mixed;
    d.keywords = union_keywords(a.keywords, b.keywords);
    d.density = (a.density + b.density) / 2.0;
    d.last_node = b.last_node;
    return d;
  }

  std::vector<Draft> group(const std::vector<Draft>& in) const {
    std::vector<Draft> out;
    for (auto& d : in) {
      if (!out.empty() && can_merge(out.back(), d)) out.back() = merge(out.back(), d);
      else out.push_back(d);
    }
    return out;
  }

  std::vector<Draft> process(int t, const std::vector<std::vector<Draft>>& results) const {
    const TreeNode& tn = tree_[t];
    if (tn.children.empty()) return t == 0 ? std::vector<Draft>{} : split_oversized(leaf(t));

    std::vector<Draft> out;
    std::vector<int> frag;
    for (int c : tn.children) {
      if (subtree_tokens_[c] >= cfg_.min_chunk_size || is_heading(c)) {
        flush_fragments(frag, out);
        auto& sub = results[c];
        out.insert(out.end(), sub.begin(), sub.end());
      } else {
        frag.push_back(c);
      }
    }
    flush_fragments(frag, out);

    if (is_heading(t)) {
      Draft h = leaf(t);
      bool attach = cfg_.include_heading_context && !out.empty() && !out[0].heading_led &&
                    fits_together(h, out[0]);
      if (attach) {
        Draft d = h;
        d.content = h.content + "\n\n" + out[0].content;
        d.tokens = tokens(d.content);
        d.keywords = union_keywords(h.keywords, out[0].keywords);
        d.last_node = out[0].last_node;
        d.density = range_density(d.first_node, d.last_node);
        out[0] = d;
      } else {
        auto hs = split_oversized(h);
        out.insert(out.begin(), hs.begin(), hs.end());
      }
    }
    return group(out);
  }

  // Move the head of b onto a until a reaches min. Cuts at line or sentence
  // ends when possible, otherwise between words.
  bool shift_front(Draft& a, Draft& b) const {
    const string& s = b.content;
    size_t word_cut = string::npos;
    for (size_t i = 1; i < s.size(); ++i) {
      if (!std::isspace((unsigned char)s[i]) || std::isspace((unsigned char)s[i-1])) continue;
      char prev = s[i-1];
      bool sentence_end = s[i] == '\n' || prev == '.' || prev == '!' || prev == '?';
      if (!sentence_end && word_cut != string::npos) continue;
      string rest = trim(s.substr(i));
      if (rest.empty()) break;
      int moved = tokens(a.content + "\n\n" + trim(s.substr(0, i)));
      if (moved > cfg_.max_chunk_size) break;
      if (moved < cfg_.min_chunk_size) continue;
      if (sentence_end) { word_cut = i; break; }
      word_cut = i;   // remember the first word cut, keep looking for a sentence end
    }
    if (word_cut == string::npos) return false;

    string head = trim(s.substr(0, word_cut));
    string rest = trim(s.substr(word_cut));
    a.content += "\n\n" + head;
    a.tokens = tokens(a.content);
    a.type = ChunkType::Mixed;
    a.keywords = union_keywords(a.keywords, extract_keywords(head, 5));
    a.last_node = b.first_node;

    b.content = rest;
    b.tokens = tokens(rest);
    b.keywords = extract_keywords(rest, 5);
    if (b.heading_led && !starts_with(rest, "#")) {
      b.heading_led = false;
      if (b.type == ChunkType::Heading) b.type = ChunkType::Mixed;
    }
    return true;
  }

  // Enforce min where section and semantic vetoes allow; only the final chunk may stay short.
  std::vector<Draft> rebalance(std::vector<Draft> v) const {
    size_t i = 0;
    while (i + 1 < v.size()) {
      if (v[i].tokens >= cfg_.min_chunk_size) { ++i; continue; }
      Draft& a = v[i];
      Draft& b = v[i+1];
      if (can_join(a, b) && fits_together(a, b)) {
        a = merge(a, b);
        v.erase(v.begin() + i + 1);
        continue;
      }
      if (i > 0 && can_join(v[i-1], a) && fits_together(v[i-1], a)) {
        v[i-1] = merge(v[i-1], a);
        v.erase(v.begin() + i);
        continue;
      }
      if (can_join(a, b) && shift_front(a, b)) continue;
      ++i;
    }
    if (v.size() >= 2) {
      Draft& prev = v[v.size() - 2];
      const Draft& last = v.back();
      if (last.tokens < cfg_.min_chunk_size && can_join(prev, last) &&
          fits_together(prev, last)) {
        prev = merge(prev, last);
        v.pop_back();
      }
    }
    return v;
  }

  const Tokenizer& tok_;
  const DocumentStructure& doc_;
  const SemanticAnalysis& analysis_;
  const ChunkingConfig& cfg_;
  std::vector<TreeNode> tree_;
  std::vector<string> node_text_;
  std::vector<int> node_tokens_;
  std::vector<int> subtree_tokens_;
  std::unordered_map<int, int> unit_of_;
  std::unordered_map<int, double> strength_at_;
};

// Trailing sentences of text worth about target tokens, never above 1.5x target.
string trailing_overlap(const Tokenizer& tok, const string& text, int target) {
  if (target <= 0) return {};
  int limit = (int)std::floor(target * 1.5);
  std::vector<string> taken;
  int total = 0;
  auto sentences = split_sentences(text);
  for (auto it = sentences.rbegin(); it != sentences.rend() && total < target; ++it) {
    int n = count_tokens(tok, *it);
    if (total + n > limit) break;
    taken.insert(taken.begin(), *it);
    total += n;
  }
  if (!taken.empty()) return join(taken, " ");

  auto words = split_words(text);
  for (auto it = words.rbegin(); it != words.rend(); ++it) {
    int n = count_tokens(tok, *it);
    if (total + n > target) break;
    taken.insert(taken.begin(), *it);
    total += n;
  }
  return join(taken, " ");
}

} // namespace

Chunker::Chunker(const Tokenizer& tokenizer, const BoundaryDetector& detector)
  : tokenizer_(tokenizer), detector_(detector) {}

ChunkingResult Chunker::chunk_document(const std::string& text,
                                       const std::string& document_id,
                                       const SourceInfo& source,
                                       const ChunkingConfig& config) const {
  config.validate();

  ChunkingResult result;
  result.effective_config = config;

  DocumentStructure doc = parser_.parse(text);
  if (doc.empty()) return result;

  SemanticAnalysis analysis = detector_.analyze(doc.nodes);
  result.degraded = analysis.degraded;

  int total = 0;
  for (auto& n : doc.nodes) total += count_tokens(tokenizer_, n.content);
  const ChunkingConfig cfg = config.adapted_for(total);
  result.effective_config = cfg;

  DocumentRun run(tokenizer_, doc, analysis, cfg);
  std::vector<Draft> drafts = run.run();

  bool has_headings = std::any_of(doc.nodes.begin(), doc.nodes.end(),
                                  [](const HierarchyNode& n) { return n.type == NodeType::Heading; });
  ChunkingMethod method = !cfg.prefer_semantic_boundaries ? ChunkingMethod::Structural
                        : has_headings ? ChunkingMethod::Hybrid : ChunkingMethod::Semantic;
  const string created_at = now_iso8601();

  auto& chunks = result.chunks;
  chunks.reserve(drafts.size());
  for (size_t i = 0; i < drafts.size(); ++i) {
    const Draft& d = drafts[i];
    DocumentChunk c;
    c.id = document_id + "#" + std::to_string(i);
    c.document_id = document_id;
    c.content = d.content;
    c.tokens = d.tokens;
    c.position = (int)i;
    c.heading_path = d.heading_path;
    c.hierarchy_level = d.level;
    c.chunk_type = d.type;
    c.semantic_density = d.density;
    c.topic_keywords = d.keywords;
    c.provenance = ChunkProvenance{source.source_file_id, source.source_file_name, method, created_at};
    chunks.push_back(std::move(c));
  }

  // overlap
  if (cfg.overlap_percentage > 0) {
    for (size_t i = 0; i + 1 < chunks.size(); ++i) {
      int target = (int)std::floor(chunks[i].tokens * cfg.overlap_percentage / 100.0);
      string ov = trailing_overlap(tokenizer_, chunks[i].content, target);
      if (ov.empty()) continue;
      chunks[i].overlap_text = ov;
      chunks[i].has_overlap_next = true;
      chunks[i+1].has_overlap_previous = true;
    }
  }

  // relationships
  std::unordered_map<string, string> owner;   // joined heading path -> heading-led chunk id
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (!drafts[i].heading_led) continue;
    owner.emplace(join(chunks[i].heading_path, " > "), chunks[i].id);
  }
  for (size_t i = 0; i < chunks.size(); ++i) {
    auto& c = chunks[i];
    if (i > 0) c.previous_chunk_id = chunks[i-1].id;
    if (i + 1 < chunks.size()) c.next_chunk_id = chunks[i+1].id;
    for (auto& o : chunks)
      if (o.id != c.id && o.hierarchy_level == c.hierarchy_level) c.sibling_chunk_ids.push_back(o.id);

    std::vector<string> parent_path = c.heading_path;
    if (drafts[i].heading_led && !parent_path.empty()) parent_path.pop_back();
    auto it = owner.find(join(parent_path, " > "));
    if (it != owner.end() && it->second != c.id && !parent_path.empty()) c.parent_section_id = it->second;
  }
  std::unordered_map<string, size_t> by_id;
  for (size_t i = 0; i < chunks.size(); ++i) by_id[chunks[i].id] = i;
  for (auto& c : chunks)
    if (!c.parent_section_id.empty()) chunks[by_id[c.parent_section_id]].child_chunk_ids.push_back(c.id);

  // metrics
  result.total_chunks = chunks.size();
  double density_sum = 0;
  int with_overlap = 0, related = 0;
  for (size_t i = 0; i < chunks.size(); ++i) {
    result.total_tokens += chunks[i].tokens;
    density_sum += chunks[i].semantic_density;
    if (i == 0) continue;
    if (chunks[i-1].has_overlap_next) ++with_overlap;
    if (paths_related(chunks[i-1].heading_path, chunks[i].heading_path)) ++related;
  }
  if (!chunks.empty()) {
    result.average_chunk_size = (double)result.total_tokens / chunks.size();
    result.semantic_coherence = density_sum / chunks.size();
  }
  if (chunks.size() >= 2) {
    result.overlap_efficiency = (double)with_overlap / (chunks.size() - 1);
    result.hierarchy_preservation = (double)related / (chunks.size() - 1);
  } else if (chunks.size() == 1) {
    result.hierarchy_preservation = 1.0;
  }

  if (result.degraded)
    spdlog::warn("document {} chunked with fallback embeddings", document_id);
  spdlog::debug("document {}: {} chunks, {} tokens", document_id, result.total_chunks, result.total_tokens);
  return result;
}

ChunkingResult Chunker::chunk_file(const std::string& path, const ChunkingConfig& config) const {
  std::string text = read_text_file(path);
  std::ostringstream id;
  id << std::hex << fnv1a(path);
  SourceInfo src{id.str(), fs::path(path).filename().string()};
  return chunk_document(text, path, src, config);
}
