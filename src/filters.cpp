// src/filters.cpp
#include "filters.hpp"
#include "text_util.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <charconv>

bool ChunkFilter::empty() const {
  return !document_id && !chunk_type && !hierarchy_level && !heading_contains &&
         !position_from && !position_to;
}

bool ChunkFilter::matches(const DocumentChunk& c) const {
  if (document_id && c.document_id != *document_id) return false;
  if (chunk_type && c.chunk_type != *chunk_type) return false;
  if (hierarchy_level && c.hierarchy_level != *hierarchy_level) return false;
  if (position_from && c.position < *position_from) return false;
  if (position_to && c.position > *position_to) return false;
  if (heading_contains && !heading_path_matches(c.heading_path, *heading_contains)) return false;
  return true;
}

bool is_numbered_hint(const std::string& hint) {
  static const RE2 re("\\d+(?:\\.\\d+)*");
  return RE2::FullMatch(hint, re);
}

bool heading_path_matches(const std::vector<std::string>& path, const std::string& hint) {
  std::string h = trim(hint);
  if (h.empty()) return true;
  if (is_numbered_hint(h)) {
    // "2" matches "2. Methods", "2 Methods", "Section 2: ..." but not "2.1" or "20"
    RE2 re("(?i)^(?:(?:section|chapter|part)\\s+)?" + RE2::QuoteMeta(h) + "\\.?(?:[^0-9.]|$)");
    for (auto& e : path)
      if (RE2::PartialMatch(e, re)) return true;
    return false;
  }
  return to_lower(join(path, " > ")).find(to_lower(h)) != std::string::npos;
}

HierarchyHints parse_hierarchical_query(const std::string& query) {
  static const RE2 level_re("(?i)level\\s*(\\d+)|\\bh(\\d+)\\b|heading\\s*(\\d+)");
  static const RE2 heading_re("(?i)(?:section|heading|chapter)\\s*[\":]*\\s*((?:\\d+(?:\\.\\d+)*)?[^,.]*)");
  static const RE2 leading_number_re("(\\d+(?:\\.\\d+)*)(?:\\s.*)?");

  HierarchyHints hints;
  std::string a, b, c;
  if (RE2::PartialMatch(query, level_re, &a, &b, &c)) {
    const std::string& n = !a.empty() ? a : !b.empty() ? b : c;
    int level = 0;
    auto r = std::from_chars(n.data(), n.data() + n.size(), level);
    // out-of-range levels are no hint at all
    if (r.ec == std::errc() && r.ptr == n.data() + n.size()) hints.level = level;
  }

  std::string heading;
  if (RE2::PartialMatch(query, heading_re, &heading)) {
    heading = trim(heading);
    std::string number;
    if (RE2::FullMatch(heading, leading_number_re, &number)) heading = number;
    if (!heading.empty()) hints.heading = heading;
  }
  return hints;
}

std::vector<std::string> query_keywords(const std::string& query) {
  std::string clean;
  for (char ch : query) {
    unsigned char u = (unsigned char)ch;
    clean += (std::isalnum(u) || u >= 0x80 || ch == '_') ? (char)std::tolower(u) : ' ';
  }
  std::vector<std::string> out;
  for (auto& w : split_words(clean))
    if (w.size() > 2 && std::find(out.begin(), out.end(), w) == out.end()) out.push_back(w);
  return out;
}

KeywordScore score_keywords(const DocumentChunk& chunk, const std::string& query,
                            const std::vector<std::string>& keywords) {
  KeywordScore s;
  if (keywords.empty()) return s;

  for (auto& k : keywords) {
    RE2 re("(?i)" + RE2::QuoteMeta(k));
    re2::StringPiece input(chunk.content);
    while (RE2::FindAndConsume(&input, re)) ++s.hits;
  }

  std::vector<std::string> words = split_words(query);
  for (auto& w : words) w = RE2::QuoteMeta(w);
  if (!words.empty() && RE2::PartialMatch(chunk.content, RE2("(?i)" + join(words, "\\s+")))) {
    s.match = KeywordMatch::ExactPhrase;
    return s;
  }

  std::vector<std::string> quoted;
  for (auto& k : keywords) quoted.push_back(RE2::QuoteMeta(k));
  if (RE2::PartialMatch(chunk.content, RE2("(?is)" + join(quoted, ".*")))) {
    s.match = KeywordMatch::AllKeywords;
    return s;
  }

  for (auto& k : keywords) {
    for (auto& t : chunk.topic_keywords) {
      if (to_lower(t) == k) { s.match = KeywordMatch::TopicOnly; return s; }
    }
  }
  return s;
}
