#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>

// HNSW over L2-normalised vectors, keyed by caller-chosen integer labels.
class Index {
public:
  // An empty path keeps the index in memory only.
  Index(const std::string& path, int dim, int M=16, int efC=200, int efS=64);
  ~Index();

  void add(long long label, const std::vector<float>& vec);   // replaces a live label's vector
  void remove(long long label);                                // no-op for unknown labels
  // (label, squared L2 distance), closest first
  std::vector<std::pair<long long, float>> search(const std::vector<float>& q, int k) const;

  // Opens the file at the configured path, or starts an empty graph.
  void load();
  void save() const;   // no-op for in-memory indexes

  int dim() const { return dim_; }
  size_t size() const;   // live labels only

private:
  std::string path_;
  int dim_;
  int M_, efC_, efS_;   // graph degree, build ef, query ef
  bool created_;
  struct Impl;          // keeps hnswlib out of this header
  std::unique_ptr<Impl> impl_;
};
