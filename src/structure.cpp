#include "structure.hpp"
#include "text_util.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <deque>

namespace {

struct RawNode {
  NodeType type;
  int level = 0;
  std::string content;
  std::string raw;
  int parent = -1;
  std::vector<std::string> path;
};

const RE2& md_heading_re() {
  static const RE2 re("(#{1,6})\\s+(.+)");
  return re;
}
const RE2& numbered_re() {
  static const RE2 re("(\\d+(?:\\.\\d+)*)(\\.?)\\s+(.+)");
  return re;
}
const RE2& bullet_re() {
  static const RE2 re("(?:[-*+]|•)\\s+(.+)");
  return re;
}
const RE2& numbered_item_re() {
  static const RE2 re("\\d+[.)]\\s+.+");
  return re;
}
const RE2& backtick_re() {
  static const RE2 re("`[^`]+`");
  return re;
}

bool looks_like_title(const std::string& title) {
  if (title.empty()) return false;
  char last = title.back();
  if (last == '.' || last == '!' || last == '?' || last == ':' || last == ';' || last == ',') return false;
  return split_words(title).size() <= 12;
}

bool is_indented_code(const std::string& line) {
  if (!line.empty() && line[0] == '\t') return true;
  return line.size() > 4 && line.compare(0, 4, "    ") == 0;
}

// Classify one trimmed, non-empty line. raw is the untrimmed line.
RawNode classify(const std::string& t, const std::string& raw) {
  RawNode n;
  n.raw = raw;
  std::string a, b, c;

  if (RE2::FullMatch(t, md_heading_re(), &a, &b)) {
    n.type = NodeType::Heading;
    n.level = (int)a.size();
    n.content = trim(b);
    return n;
  }
  if (RE2::FullMatch(t, numbered_re(), &a, &b, &c)) {
    int parts = 1 + (int)std::count(a.begin(), a.end(), '.');
    bool heading = looks_like_title(trim(c)) && (parts > 1 || !b.empty());
    if (heading) {
      n.type = NodeType::Heading;
      n.level = parts;
      n.content = t;
      return n;
    }
  }
  if (RE2::FullMatch(t, bullet_re(), &a)) {
    n.type = NodeType::List;
    n.content = "• " + trim(a);
    return n;
  }
  if (RE2::FullMatch(t, numbered_item_re())) {
    n.type = NodeType::List;
    n.content = t;
    return n;
  }
  if (std::count(t.begin(), t.end(), '|') >= 2) {
    n.type = NodeType::Table;
    n.content = t;
    return n;
  }
  if (is_indented_code(raw) || RE2::FullMatch(t, backtick_re())) {
    n.type = NodeType::Code;
    n.content = t;
    return n;
  }
  n.type = NodeType::Paragraph;
  n.content = t;
  return n;
}

std::vector<RawNode> scan(const std::string& text) {
  std::vector<RawNode> out;
  std::vector<int> stack;   // open headings, innermost last

  auto attach = [&](RawNode n) {
    if (n.type == NodeType::Heading) {
      while (!stack.empty() && out[stack.back()].level >= n.level) stack.pop_back();
    }
    n.parent = stack.empty() ? -1 : stack.back();
    for (int h : stack) n.path.push_back(out[h].content);
    out.push_back(std::move(n));
    if (out.back().type == NodeType::Heading) stack.push_back((int)out.size() - 1);
  };

  bool in_fence = false;
  std::vector<std::string> fence_lines;
  std::string fence_raw;
  auto close_fence = [&] {
    std::string body = trim(join(fence_lines, "\n"));
    if (!body.empty()) {
      RawNode n;
      n.type = NodeType::Code;
      n.content = body;
      n.raw = fence_raw;
      attach(std::move(n));
    }
    fence_lines.clear();
    fence_raw.clear();
    in_fence = false;
  };

  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos) nl = text.size();
    std::string line = text.substr(start, nl - start);
    start = nl + 1;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::string t = trim(line);

    if (in_fence) {
      fence_raw += "\n" + line;
      if (starts_with(t, "```")) close_fence();
      else fence_lines.push_back(line);
      continue;
    }
    if (t.empty()) continue;
    if (starts_with(t, "```")) {
      if (t.size() >= 6 && t.compare(t.size() - 3, 3, "```") == 0) {
        RawNode n;
        n.type = NodeType::Code;
        n.content = t;
        n.raw = line;
        attach(std::move(n));
      } else {
        in_fence = true;
        fence_raw = line;
      }
      continue;
    }
    attach(classify(t, line));
  }
  if (in_fence) close_fence();
  return out;
}

bool groupable(NodeType t) {
  return t == NodeType::Paragraph || t == NodeType::List || t == NodeType::Table;
}

} // namespace

const char* to_string(NodeType t) {
  switch (t) {
    case NodeType::Heading: return "heading";
    case NodeType::Paragraph: return "paragraph";
    case NodeType::List: return "list";
    case NodeType::Table: return "table";
    case NodeType::Code: return "code";
    case NodeType::Text: return "text";
  }
  return "text";
}

const HierarchyNode* DocumentStructure::find(const std::string& id) const {
  auto it = index.find(id);
  return it == index.end() ? nullptr : &nodes[it->second];
}

DocumentStructure StructureParser::parse(const std::string& text) const {
  DocumentStructure s;
  auto raw = scan(text);
  if (raw.empty()) return s;

  // group consecutive same-type siblings
  std::vector<int> final_of(raw.size(), -1);
  int last_raw = -1;
  for (size_t r = 0; r < raw.size(); ++r) {
    const RawNode& rn = raw[r];
    bool merge = false;
    if (last_raw == (int)r - 1 && last_raw >= 0 && groupable(rn.type)) {
      const RawNode& prev = raw[last_raw];
      merge = prev.type == rn.type && prev.parent == rn.parent && !s.nodes.empty();
    }
    if (merge) {
      HierarchyNode& g = s.nodes.back();
      g.content += rn.type == NodeType::Paragraph ? " " : "\n";
      g.content += rn.content;
      g.raw_text += "\n" + rn.raw;
    } else {
      HierarchyNode n;
      n.type = rn.type;
      n.level = rn.level;
      n.content = rn.content;
      n.path = rn.path;
      n.raw_text = rn.raw;
      if (rn.parent >= 0) n.parent = (size_t)final_of[rn.parent];
      s.nodes.push_back(std::move(n));
    }
    final_of[r] = (int)s.nodes.size() - 1;
    last_raw = (int)r;
  }

  for (size_t i = 0; i < s.nodes.size(); ++i) {
    HierarchyNode& n = s.nodes[i];
    n.position = (int)i;
    n.id = "node_" + std::to_string(i + 1);
    s.index[n.id] = i;
    if (n.parent) s.nodes[*n.parent].children.push_back(i);
    else s.root_nodes.push_back(i);
    if (n.type == NodeType::Heading) {
      auto full = n.path;
      full.push_back(n.content);
      s.heading_paths[n.id] = std::move(full);
    }
  }
  return s;
}

std::vector<const HierarchyNode*> nodes_under_heading(const DocumentStructure& s, const std::string& heading_id) {
  std::vector<const HierarchyNode*> out;
  const HierarchyNode* h = s.find(heading_id);
  if (!h) return out;
  std::deque<size_t> queue(h->children.begin(), h->children.end());
  while (!queue.empty()) {
    size_t i = queue.front();
    queue.pop_front();
    out.push_back(&s.nodes[i]);
    for (size_t c : s.nodes[i].children) queue.push_back(c);
  }
  return out;
}

std::vector<const HierarchyNode*> headings_at_level(const DocumentStructure& s, int level) {
  std::vector<const HierarchyNode*> out;
  for (auto& n : s.nodes)
    if (n.type == NodeType::Heading && n.level == level) out.push_back(&n);
  return out;
}

std::string structure_to_text(const DocumentStructure& s) {
  std::vector<std::string> blocks;
  std::vector<size_t> stack(s.root_nodes.rbegin(), s.root_nodes.rend());
  while (!stack.empty()) {
    const HierarchyNode& n = s.nodes[stack.back()];
    stack.pop_back();
    if (n.type == NodeType::Heading) blocks.push_back(std::string((size_t)std::max(1, n.level), '#') + " " + n.content);
    else blocks.push_back(n.content);
    for (auto it = n.children.rbegin(); it != n.children.rend(); ++it) stack.push_back(*it);
  }
  return join(blocks, "\n\n");
}
