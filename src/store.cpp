#include "store.hpp"
#include "text_util.hpp"
#include <sqlite3.h>

using nlohmann::json;

// ---------------------------------------------------------------- json

json chunk_to_json(const DocumentChunk& c) {
  return json{
    {"id", c.id},
    {"document_id", c.document_id},
    {"content", c.content},
    {"tokens", c.tokens},
    {"position", c.position},
    {"heading_path", c.heading_path},
    {"hierarchy_level", c.hierarchy_level},
    {"parent_section_id", c.parent_section_id},
    {"chunk_type", to_string(c.chunk_type)},
    {"semantic_density", c.semantic_density},
    {"topic_keywords", c.topic_keywords},
    {"has_overlap_previous", c.has_overlap_previous},
    {"has_overlap_next", c.has_overlap_next},
    {"overlap_text", c.overlap_text},
    {"previous_chunk_id", c.previous_chunk_id},
    {"next_chunk_id", c.next_chunk_id},
    {"sibling_chunk_ids", c.sibling_chunk_ids},
    {"child_chunk_ids", c.child_chunk_ids},
    {"source_file_id", c.provenance.source_file_id},
    {"source_file_name", c.provenance.source_file_name},
    {"chunking_method", to_string(c.provenance.chunking_method)},
    {"created_at", c.provenance.created_at},
  };
}

DocumentChunk chunk_from_json(const json& j) {
  try {
    DocumentChunk c;
    c.id = j.at("id").get<std::string>();
    c.document_id = j.at("document_id").get<std::string>();
    c.content = j.at("content").get<std::string>();
    c.tokens = j.at("tokens").get<int>();
    c.position = j.at("position").get<int>();
    c.heading_path = j.at("heading_path").get<std::vector<std::string>>();
    c.hierarchy_level = j.at("hierarchy_level").get<int>();
    c.parent_section_id = j.value("parent_section_id", std::string());
    c.chunk_type = chunk_type_from_string(j.at("chunk_type").get<std::string>());
    c.semantic_density = j.at("semantic_density").get<double>();
    c.topic_keywords = j.at("topic_keywords").get<std::vector<std::string>>();
    c.has_overlap_previous = j.at("has_overlap_previous").get<bool>();
    c.has_overlap_next = j.at("has_overlap_next").get<bool>();
    c.overlap_text = j.value("overlap_text", std::string());
    c.previous_chunk_id = j.value("previous_chunk_id", std::string());
    c.next_chunk_id = j.value("next_chunk_id", std::string());
    c.sibling_chunk_ids = j.value("sibling_chunk_ids", std::vector<std::string>());
    c.child_chunk_ids = j.value("child_chunk_ids", std::vector<std::string>());
    c.provenance.source_file_id = j.value("source_file_id", std::string());
    c.provenance.source_file_name = j.value("source_file_name", std::string());
    c.provenance.chunking_method = chunking_method_from_string(j.value("chunking_method", std::string("hybrid")));
    c.provenance.created_at = j.value("created_at", std::string());
    return c;
  } catch (const json::exception& e) {
    throw StoreError(std::string("store: malformed chunk: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw StoreError(std::string("store: malformed chunk: ") + e.what());
  }
}

// ---------------------------------------------------------------- sqlite

namespace {

// Prepared statement, finalized on scope exit.
class Stmt {
public:
  Stmt(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK)
      throw StoreError(std::string("store: prepare failed: ") + sqlite3_errmsg(db));
  }
  ~Stmt() { sqlite3_finalize(st_); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  void bind(int i, const std::string& v) { sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT); }
  void bind(int i, long long v) { sqlite3_bind_int64(st_, i, (sqlite3_int64)v); }
  void bind(int i, int v) { sqlite3_bind_int(st_, i, v); }

  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError(std::string("store: step failed: ") + sqlite3_errmsg(db_));
  }

  std::string text(int col) const {
    auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st_, col));
    return p ? std::string(p) : std::string();
  }
  long long int64(int col) const { return (long long)sqlite3_column_int64(st_, col); }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    throw StoreError("store: " + e);
  }
}

DocumentChunk decode_row(const std::string& id, const std::string& data) {
  json j = json::parse(data, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) throw StoreError("store: malformed chunk row " + id);
  return chunk_from_json(j);
}

std::string like_escape(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '%' || c == '_' || c == '\\') out += '\\';
    out += c;
  }
  return out;
}

} // namespace

struct Store::Impl {
  sqlite3* db = nullptr;
};

Store::Store(const std::string& path) : impl_(new Impl) {
  if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
    std::string e = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    sqlite3_close(impl_->db);
    delete impl_;
    throw StoreError("store: open failed for " + path + ": " + e);
  }
  try {
    ensure_schema();
  } catch (...) {
    sqlite3_close(impl_->db);
    delete impl_;
    throw;
  }
}

Store::~Store() {
  if (impl_) {
    if (impl_->db) sqlite3_close(impl_->db);
    delete impl_;
  }
}

void Store::ensure_schema() {
  exec(impl_->db,
    "CREATE TABLE IF NOT EXISTS chunks ("
    " id TEXT PRIMARY KEY,"
    " label INTEGER NOT NULL UNIQUE,"
    " document_id TEXT NOT NULL,"
    " position INTEGER NOT NULL,"
    " chunk_type TEXT NOT NULL,"
    " hierarchy_level INTEGER NOT NULL,"
    " heading_path TEXT NOT NULL,"
    " data TEXT NOT NULL"
    ");"
    "CREATE INDEX IF NOT EXISTS chunks_document ON chunks(document_id, position);"
    "CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value INTEGER NOT NULL);"
    "INSERT OR IGNORE INTO meta (key, value) VALUES ('next_label', 0);");
}

void Store::begin() { exec(impl_->db, "BEGIN IMMEDIATE;"); }
void Store::commit() { exec(impl_->db, "COMMIT;"); }
void Store::rollback() { exec(impl_->db, "ROLLBACK;"); }

std::optional<long long> Store::label_of(const std::string& id) const {
  Stmt st(impl_->db, "SELECT label FROM chunks WHERE id=?");
  st.bind(1, id);
  if (!st.step()) return std::nullopt;
  return st.int64(0);
}

long long Store::reserve_labels(long long n) {
  if (n < 0) throw StoreError("store: negative label reservation");
  if (!sqlite3_get_autocommit(impl_->db))
    throw StoreError("store: labels must be reserved outside a transaction");
  Stmt next(impl_->db, "SELECT value FROM meta WHERE key='next_label'");
  if (!next.step()) throw StoreError("store: label counter missing");
  long long first = next.int64(0);
  Stmt bump(impl_->db, "UPDATE meta SET value=value+? WHERE key='next_label'");
  bump.bind(1, n);
  bump.step();
  return first;
}

std::optional<long long> Store::upsert_chunk(const DocumentChunk& c, long long label) {
  auto previous = label_of(c.id);
  std::string data = chunk_to_json(c).dump();

  Stmt st(impl_->db,
    "INSERT INTO chunks (id, label, document_id, position, chunk_type, hierarchy_level, heading_path, data) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(id) DO UPDATE SET label=excluded.label,"
    " document_id=excluded.document_id, position=excluded.position, chunk_type=excluded.chunk_type,"
    " hierarchy_level=excluded.hierarchy_level, heading_path=excluded.heading_path, data=excluded.data;");
  st.bind(1, c.id);
  st.bind(2, label);
  st.bind(3, c.document_id);
  st.bind(4, c.position);
  st.bind(5, std::string(to_string(c.chunk_type)));
  st.bind(6, c.hierarchy_level);
  st.bind(7, join(c.heading_path, " > "));
  st.bind(8, data);
  st.step();
  return previous;
}

std::optional<DocumentChunk> Store::get_chunk(const std::string& id) const {
  Stmt st(impl_->db, "SELECT data FROM chunks WHERE id=?");
  st.bind(1, id);
  if (!st.step()) return std::nullopt;
  return decode_row(id, st.text(0));
}

std::optional<DocumentChunk> Store::get_by_label(long long label) const {
  Stmt st(impl_->db, "SELECT id, data FROM chunks WHERE label=?");
  st.bind(1, label);
  if (!st.step()) return std::nullopt;
  return decode_row(st.text(0), st.text(1));
}

std::vector<DocumentChunk> Store::find(const ChunkFilter& filter, int limit) const {
  // SQL narrows the candidates; ChunkFilter::matches has the final say
  std::string sql = "SELECT id, data FROM chunks WHERE 1=1";
  if (filter.document_id) sql += " AND document_id=?";
  if (filter.chunk_type) sql += " AND chunk_type=?";
  if (filter.hierarchy_level) sql += " AND hierarchy_level=?";
  if (filter.position_from) sql += " AND position>=?";
  if (filter.position_to) sql += " AND position<=?";
  bool like = filter.heading_contains && !is_numbered_hint(trim(*filter.heading_contains));
  if (like) sql += " AND lower(heading_path) LIKE ? ESCAPE '\\'";
  sql += " ORDER BY document_id, position";

  Stmt st(impl_->db, sql);
  int i = 1;
  if (filter.document_id) st.bind(i++, *filter.document_id);
  if (filter.chunk_type) st.bind(i++, std::string(to_string(*filter.chunk_type)));
  if (filter.hierarchy_level) st.bind(i++, *filter.hierarchy_level);
  if (filter.position_from) st.bind(i++, *filter.position_from);
  if (filter.position_to) st.bind(i++, *filter.position_to);
  if (like) st.bind(i++, "%" + like_escape(to_lower(trim(*filter.heading_contains))) + "%");

  std::vector<DocumentChunk> out;
  while (st.step()) {
    auto c = decode_row(st.text(0), st.text(1));
    if (!filter.matches(c)) continue;
    out.push_back(std::move(c));
    if (limit > 0 && (int)out.size() >= limit) break;
  }
  return out;
}

std::vector<long long> Store::remove_document(const std::string& document_id) {
  std::vector<long long> labels;
  {
    Stmt st(impl_->db, "SELECT label FROM chunks WHERE document_id=?");
    st.bind(1, document_id);
    while (st.step()) labels.push_back(st.int64(0));
  }
  Stmt del(impl_->db, "DELETE FROM chunks WHERE document_id=?");
  del.bind(1, document_id);
  del.step();
  return labels;
}

size_t Store::count() const {
  Stmt st(impl_->db, "SELECT COUNT(*) FROM chunks");
  st.step();
  return (size_t)st.int64(0);
}

std::optional<long long> Store::meta(const std::string& key) const {
  Stmt st(impl_->db, "SELECT value FROM meta WHERE key=?");
  st.bind(1, key);
  if (!st.step()) return std::nullopt;
  return st.int64(0);
}

void Store::set_meta(const std::string& key, long long value) {
  Stmt st(impl_->db, "INSERT INTO meta (key, value) VALUES (?, ?) "
                     "ON CONFLICT(key) DO UPDATE SET value=excluded.value");
  st.bind(1, key);
  st.bind(2, value);
  st.step();
}
