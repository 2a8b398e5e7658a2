#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class NodeType { Heading, Paragraph, List, Table, Code, Text };

const char* to_string(NodeType t);

struct HierarchyNode {
  std::string id;                  // node_<n>
  NodeType type = NodeType::Paragraph;
  int level = 0;                   // heading level as written, 0 for content
  std::string content;
  std::optional<size_t> parent;    // arena index
  std::vector<size_t> children;    // arena indices, document order
  std::vector<std::string> path;   // ancestor heading titles
  int position = 0;
  std::string raw_text;
};

// Flat arena of parsed nodes. Read-only once parse() returns.
struct DocumentStructure {
  std::vector<HierarchyNode> nodes;
  std::vector<size_t> root_nodes;
  std::unordered_map<std::string, size_t> index;
  std::unordered_map<std::string, std::vector<std::string>> heading_paths;   // heading id -> full path

  const HierarchyNode* find(const std::string& id) const;
  bool empty() const { return nodes.empty(); }
};

// Line-oriented markup recovery: markdown and numbered headings, bullet and
// numbered lists, pipe tables, indented/fenced/backtick code, paragraphs.
// Never throws; unrecognised lines become paragraphs.
class StructureParser {
public:
  DocumentStructure parse(const std::string& text) const;
};

// Breadth-first descendants of a heading.
std::vector<const HierarchyNode*> nodes_under_heading(const DocumentStructure& s, const std::string& heading_id);
std::vector<const HierarchyNode*> headings_at_level(const DocumentStructure& s, int level);
std::string structure_to_text(const DocumentStructure& s);
