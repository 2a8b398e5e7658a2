#include "text_util.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <unordered_map>

static bool is_space(char c) { return std::isspace((unsigned char)c) != 0; }

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e-1])) --e;
  return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (is_space(c)) {
      if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t nl = s.find('\n', start);
    if (nl == std::string::npos) nl = s.size();
    auto line = trim(s.substr(start, nl - start));
    if (!line.empty()) out.push_back(line);
    start = nl + 1;
  }
  return out;
}

std::vector<std::string> split_sentences(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  auto flush = [&]{
    auto t = trim(cur);
    if (!t.empty()) out.push_back(t);
    cur.clear();
  };
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '\n') { flush(); continue; }
    cur += c;
    if (c == '.' || c == '!' || c == '?') {
      // swallow a run of terminators, then cut only before whitespace
      while (i + 1 < s.size() && (s[i+1] == '.' || s[i+1] == '!' || s[i+1] == '?')) cur += s[++i];
      if (i + 1 >= s.size() || is_space(s[i+1])) flush();
    }
  }
  flush();
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

std::vector<std::string> extract_keywords(const std::string& text, size_t top_n) {
  std::string clean;
  clean.reserve(text.size());
  for (char c : text) {
    unsigned char u = (unsigned char)c;
    if (std::isalnum(u) || c == '_') clean += (char)std::tolower(u);
    else if (is_space(c)) clean += ' ';
  }

  std::unordered_map<std::string, int> freq;
  std::vector<std::string> order;
  for (auto& w : split_words(clean)) {
    if (w.size() <= 3) continue;
    if (freq[w]++ == 0) order.push_back(w);
  }
  std::stable_sort(order.begin(), order.end(), [&](const std::string& a, const std::string& b) {
    return freq[a] > freq[b];
  });
  if (order.size() > top_n) order.resize(top_n);
  return order;
}

uint64_t fnv1a(const std::string& s) {
  uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : s) { h ^= c; h *= 1099511628211ULL; }
  return h;
}

std::string now_iso8601() {
  auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}
