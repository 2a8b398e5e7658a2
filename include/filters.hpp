#pragma once
#include "chunker.hpp"
#include <optional>
#include <string>
#include <vector>

// Metadata predicate shared by the vector store and the retriever.
struct ChunkFilter {
  std::optional<std::string> document_id;
  std::optional<ChunkType> chunk_type;
  std::optional<int> hierarchy_level;
  std::optional<std::string> heading_contains;   // see heading_path_matches
  std::optional<int> position_from;              // inclusive
  std::optional<int> position_to;                // inclusive

  bool matches(const DocumentChunk& c) const;
  bool empty() const;
};

// A numbered hint ("2", "3.1") matches path elements carrying that number;
// any other hint is a case-insensitive substring of the " > "-joined path.
bool heading_path_matches(const std::vector<std::string>& path, const std::string& hint);
bool is_numbered_hint(const std::string& hint);

// Structural cues in free text: "level 2", "h3", "section Methods", "chapter 4".
struct HierarchyHints {
  std::optional<std::string> heading;
  std::optional<int> level;
  bool empty() const { return !heading && !level; }
};

HierarchyHints parse_hierarchical_query(const std::string& query);

// Lowercase query words longer than two characters, punctuation stripped.
std::vector<std::string> query_keywords(const std::string& query);

// Ranked best last: the whole query verbatim, every keyword in query order,
// or a keyword among the chunk's topic keywords only.
enum class KeywordMatch { None = 0, TopicOnly = 1, AllKeywords = 2, ExactPhrase = 3 };

struct KeywordScore {
  KeywordMatch match = KeywordMatch::None;
  int hits = 0;                   // keyword occurrences in content
};

KeywordScore score_keywords(const DocumentChunk& chunk, const std::string& query,
                            const std::vector<std::string>& keywords);
