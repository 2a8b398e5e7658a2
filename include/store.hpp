#pragma once
#include "chunker.hpp"
#include "filters.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Failure in the persistence layer, including rows that no longer decode.
struct StoreError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

nlohmann::json chunk_to_json(const DocumentChunk& c);
DocumentChunk chunk_from_json(const nlohmann::json& j);   // throws StoreError

// SQLite table of chunk metadata. Each chunk carries an integer label that
// keys its vector in the HNSW index.
class Store {
public:
  explicit Store(const std::string& sqlite_path);
  ~Store();
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  void ensure_schema();

  void begin();
  void commit();
  void rollback();

  // Hands out n consecutive labels and returns the first. Must run outside a
  // transaction: a reservation survives later rollbacks, so a label is never
  // given out twice.
  long long reserve_labels(long long n);
  // Writes c under label, returning the label c.id held before, if any.
  std::optional<long long> upsert_chunk(const DocumentChunk& c, long long label);
  std::optional<DocumentChunk> get_chunk(const std::string& id) const;
  std::optional<DocumentChunk> get_by_label(long long label) const;
  std::optional<long long> label_of(const std::string& id) const;

  // Ordered by (document_id, position). limit <= 0 means no limit.
  std::vector<DocumentChunk> find(const ChunkFilter& filter, int limit = 0) const;

  // Deletes every chunk of the document and returns their labels.
  std::vector<long long> remove_document(const std::string& document_id);

  size_t count() const;

  std::optional<long long> meta(const std::string& key) const;
  void set_meta(const std::string& key, long long value);

private:
  struct Impl;
  Impl* impl_;
};
