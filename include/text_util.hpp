#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);

// Whitespace-separated words, in order.
std::vector<std::string> split_words(const std::string& s);
std::vector<std::string> split_lines(const std::string& s);   // trimmed, non-empty

// Sentences keep their terminating punctuation; a newline also ends one.
std::vector<std::string> split_sentences(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Top-N words longer than 3 chars by frequency (ties keep first occurrence).
std::vector<std::string> extract_keywords(const std::string& text, size_t top_n = 5);

uint64_t fnv1a(const std::string& s);
std::string now_iso8601();
