#pragma once
#include "chunker.hpp"
#include "filters.hpp"
#include "index.hpp"
#include "store.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct VectorHit {
  DocumentChunk chunk;
  double distance = 0.0;   // cosine distance, 1 - similarity
};

// Chunk corpus with vector search. One instance serves one project.
class VectorStore {
public:
  virtual ~VectorStore() = default;

  virtual void upsert(const DocumentChunk& chunk, const std::vector<float>& vec) = 0;
  // All or nothing.
  virtual void upsert_batch(const std::vector<DocumentChunk>& chunks,
                            const std::vector<std::vector<float>>& vecs) = 0;
  // Drops the document's previous chunks and writes the new set, all or nothing.
  virtual void replace_document(const std::string& document_id,
                                const std::vector<DocumentChunk>& chunks,
                                const std::vector<std::vector<float>>& vecs) = 0;

  // Nearest first, restricted to chunks matching filter.
  virtual std::vector<VectorHit> query(const std::vector<float>& vec, int top_k,
                                       const ChunkFilter& filter = ChunkFilter{}) const = 0;
  virtual std::vector<DocumentChunk> get_by_filter(const ChunkFilter& filter, int limit = 0) const = 0;
  virtual std::optional<DocumentChunk> get(const std::string& id) const = 0;
  virtual void remove_document(const std::string& document_id) = 0;
  virtual size_t size() const = 0;
};

// SQLite rows for metadata, hnswlib for vectors, sharing integer labels.
class HnswChunkStore : public VectorStore {
public:
  // Empty hnsw_path keeps vectors in memory; ":memory:" works for sqlite_path.
  HnswChunkStore(const std::string& sqlite_path, const std::string& hnsw_path, int dim);

  void upsert(const DocumentChunk& chunk, const std::vector<float>& vec) override;
  void upsert_batch(const std::vector<DocumentChunk>& chunks,
                    const std::vector<std::vector<float>>& vecs) override;
  void replace_document(const std::string& document_id,
                        const std::vector<DocumentChunk>& chunks,
                        const std::vector<std::vector<float>>& vecs) override;
  std::vector<VectorHit> query(const std::vector<float>& vec, int top_k,
                               const ChunkFilter& filter = ChunkFilter{}) const override;
  std::vector<DocumentChunk> get_by_filter(const ChunkFilter& filter, int limit = 0) const override;
  std::optional<DocumentChunk> get(const std::string& id) const override;
  void remove_document(const std::string& document_id) override;
  size_t size() const override;

  size_t vector_count() const;   // live vectors; equals size() when consistent
  void save() const;
  int dim() const { return index_.dim(); }

private:
  void write(const std::string* document_id, const std::vector<DocumentChunk>& chunks,
             const std::vector<std::vector<float>>& vecs);

  Store store_;
  Index index_;
  mutable std::mutex mutex_;
};
