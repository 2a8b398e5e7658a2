#include "vector_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

HnswChunkStore::HnswChunkStore(const std::string& sqlite_path, const std::string& hnsw_path, int dim)
  : store_(sqlite_path), index_(hnsw_path, dim) {
  auto stored = store_.meta("dimension");
  if (stored && *stored != dim)
    throw StoreError("store: index was built with dimension " + std::to_string(*stored) +
                     ", embedder produces " + std::to_string(dim));
  if (!stored) store_.set_meta("dimension", dim);
  index_.load();
}

void HnswChunkStore::write(const std::string* document_id, const std::vector<DocumentChunk>& chunks,
                           const std::vector<std::vector<float>>& vecs) {
  if (chunks.size() != vecs.size())
    throw StoreError("store: " + std::to_string(chunks.size()) + " chunks but " +
                     std::to_string(vecs.size()) + " vectors");
  for (auto& v : vecs)
    if ((int)v.size() != index_.dim())
      throw StoreError("store: vector dimension " + std::to_string(v.size()) +
                       " does not match index dimension " + std::to_string(index_.dim()));

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<long long> old_labels, added;
  // every write gets fresh labels so a rollback never has to restore a vector
  long long first = store_.reserve_labels((long long)chunks.size());
  store_.begin();
  try {
    if (document_id) old_labels = store_.remove_document(*document_id);
    for (size_t i = 0; i < chunks.size(); ++i) {
      long long label = first + (long long)i;
      if (auto prev = store_.upsert_chunk(chunks[i], label)) old_labels.push_back(*prev);
      index_.add(label, vecs[i]);
      added.push_back(label);
    }
    store_.commit();
  } catch (const std::exception& e) {
    spdlog::error("store write failed, rolling back: {}", e.what());
    for (long long l : added) index_.remove(l);
    try {
      store_.rollback();
    } catch (const std::exception& re) {
      spdlog::error("rollback failed: {}", re.what());
    }
    throw;
  }
  for (long long l : old_labels) index_.remove(l);
}

void HnswChunkStore::upsert(const DocumentChunk& chunk, const std::vector<float>& vec) {
  write(nullptr, {chunk}, {vec});
}

void HnswChunkStore::upsert_batch(const std::vector<DocumentChunk>& chunks,
                                  const std::vector<std::vector<float>>& vecs) {
  write(nullptr, chunks, vecs);
}

void HnswChunkStore::replace_document(const std::string& document_id,
                                      const std::vector<DocumentChunk>& chunks,
                                      const std::vector<std::vector<float>>& vecs) {
  write(&document_id, chunks, vecs);
}

std::vector<VectorHit> HnswChunkStore::query(const std::vector<float>& vec, int top_k,
                                             const ChunkFilter& filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<VectorHit> hits;
  int total = (int)index_.size();
  if (top_k <= 0 || total == 0) return hits;

  // oversample, doubling until enough hits survive the filter
  int k = filter.empty() ? std::min(top_k, total) : std::min(total, top_k * 4);
  while (true) {
    hits.clear();
    for (auto& r : index_.search(vec, k)) {
      auto c = store_.get_by_label(r.first);
      if (!c || !filter.matches(*c)) continue;
      hits.push_back(VectorHit{std::move(*c), std::max(0.0, (double)r.second / 2.0)});
      if ((int)hits.size() >= top_k) break;
    }
    if ((int)hits.size() >= top_k || k >= total) break;
    k = std::min(total, k * 2);
  }
  return hits;
}

std::vector<DocumentChunk> HnswChunkStore::get_by_filter(const ChunkFilter& filter, int limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.find(filter, limit);
}

std::optional<DocumentChunk> HnswChunkStore::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.get_chunk(id);
}

void HnswChunkStore::remove_document(const std::string& document_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (long long l : store_.remove_document(document_id)) index_.remove(l);
}

size_t HnswChunkStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.count();
}

size_t HnswChunkStore::vector_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.size();
}

void HnswChunkStore::save() const {
  std::lock_guard<std::mutex> lock(mutex_);
  index_.save();
}
