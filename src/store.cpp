#include "store.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>

using json = nlohmann::json;

struct Store::Impl {
  sqlite3* db = nullptr;
};

namespace {
// Finalizes on scope exit so every throw path releases the statement.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  Stmt(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
      throw IndexError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
  }
  ~Stmt() { sqlite3_finalize(st); }
  void text(int i, const std::string& s) { sqlite3_bind_text(st, i, s.c_str(), -1, SQLITE_TRANSIENT); }
  void integer(int i, int64_t v) { sqlite3_bind_int64(st, i, (sqlite3_int64)v); }
  int step() { return sqlite3_step(st); }
  std::string col_text(int i) const {
    auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st, i));
    return p ? p : "";
  }
  int64_t col_int(int i) const { return (int64_t)sqlite3_column_int64(st, i); }
};

std::string metadata_to_json(const Metadata& md) {
  json j = json::object();
  for (auto& kv : md) j[kv.first] = kv.second;
  return j.dump();
}

Metadata metadata_from_json(const std::string& s) {
  Metadata md;
  if (s.empty()) return md;
  auto j = json::parse(s, nullptr, /*allow_exceptions=*/false);
  if (!j.is_object()) return md;
  for (auto it = j.begin(); it != j.end(); ++it)
    if (it.value().is_string()) md[it.key()] = it.value().get<std::string>();
  return md;
}
} // namespace

Store::Store(const std::string& path) : impl_(new Impl) {
  if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
    std::string e = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    sqlite3_close(impl_->db);
    delete impl_;
    throw IndexError("sqlite open failed: " + e);
  }
  sqlite3_busy_timeout(impl_->db, 5000);
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

void Store::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(impl_->db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    throw IndexError("sqlite: " + e);
  }
}

void Store::ensure_schema() {
  exec(
    "CREATE TABLE IF NOT EXISTS collections ("
    " name TEXT PRIMARY KEY,"
    " dimension INTEGER NOT NULL,"
    " distance TEXT NOT NULL,"
    " m INTEGER NOT NULL,"
    " ef_construction INTEGER NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS points ("
    " label INTEGER PRIMARY KEY AUTOINCREMENT,"
    " collection TEXT NOT NULL,"
    " id TEXT NOT NULL,"
    " doc_id TEXT NOT NULL,"
    " source TEXT NOT NULL,"
    " chunk_index INTEGER NOT NULL,"
    " text TEXT NOT NULL,"
    " metadata TEXT NOT NULL,"
    " UNIQUE(collection, id)"
    ");"
    "CREATE INDEX IF NOT EXISTS points_doc ON points(collection, doc_id);");
}

std::optional<CollectionRow> Store::get_collection(const std::string& name) const {
  Stmt st(impl_->db, "SELECT dimension, distance, m, ef_construction FROM collections WHERE name=?");
  st.text(1, name);
  if (st.step() != SQLITE_ROW) return std::nullopt;
  CollectionRow row;
  row.name = name;
  row.spec.dimension = (int)st.col_int(0);
  row.spec.distance = parse_distance(st.col_text(1));
  row.m = (int)st.col_int(2);
  row.ef_construction = (int)st.col_int(3);
  return row;
}

void Store::insert_collection(const CollectionRow& row) {
  Stmt st(impl_->db,
    "INSERT INTO collections (name, dimension, distance, m, ef_construction) "
    "VALUES (?, ?, ?, ?, ?)");
  st.text(1, row.name);
  st.integer(2, row.spec.dimension);
  st.text(3, distance_name(row.spec.distance));
  st.integer(4, row.m);
  st.integer(5, row.ef_construction);
  if (st.step() != SQLITE_DONE)
    throw IndexError(std::string("sqlite insert collection failed: ") + sqlite3_errmsg(impl_->db));
}

uint64_t Store::upsert_point(const std::string& collection, const IndexedPoint& p) {
  const DocumentChunk& c = p.chunk;
  std::optional<uint64_t> label;
  {
    Stmt st(impl_->db, "SELECT label FROM points WHERE collection=? AND id=?");
    st.text(1, collection);
    st.text(2, c.id);
    if (st.step() == SQLITE_ROW) label = (uint64_t)st.col_int(0);
  }

  if (label) {
    Stmt st(impl_->db,
      "UPDATE points SET doc_id=?, source=?, chunk_index=?, text=?, metadata=? WHERE label=?");
    st.text(1, c.doc_id);
    st.text(2, c.source);
    st.integer(3, c.chunk_index);
    st.text(4, c.text);
    st.text(5, metadata_to_json(p.metadata));
    st.integer(6, (int64_t)*label);
    if (st.step() != SQLITE_DONE)
      throw IndexError(std::string("sqlite update failed: ") + sqlite3_errmsg(impl_->db));
    return *label;
  }

  Stmt st(impl_->db,
    "INSERT INTO points (collection, id, doc_id, source, chunk_index, text, metadata) "
    "VALUES (?, ?, ?, ?, ?, ?, ?)");
  st.text(1, collection);
  st.text(2, c.id);
  st.text(3, c.doc_id);
  st.text(4, c.source);
  st.integer(5, c.chunk_index);
  st.text(6, c.text);
  st.text(7, metadata_to_json(p.metadata));
  if (st.step() != SQLITE_DONE)
    throw IndexError(std::string("sqlite insert failed: ") + sqlite3_errmsg(impl_->db));
  return (uint64_t)sqlite3_last_insert_rowid(impl_->db);
}

std::optional<Payload> Store::get_payload(const std::string& collection, uint64_t label) const {
  Stmt st(impl_->db,
    "SELECT id, doc_id, source, chunk_index, text, metadata FROM points "
    "WHERE collection=? AND label=?");
  st.text(1, collection);
  st.integer(2, (int64_t)label);
  if (st.step() != SQLITE_ROW) return std::nullopt;
  Payload p;
  p.id = st.col_text(0);
  p.doc_id = st.col_text(1);
  p.source = st.col_text(2);
  p.chunk_index = (int)st.col_int(3);
  p.text = st.col_text(4);
  p.metadata = metadata_from_json(st.col_text(5));
  return p;
}

std::vector<uint64_t> Store::labels_for_doc(const std::string& collection, const std::string& doc_id) const {
  Stmt st(impl_->db, "SELECT label FROM points WHERE collection=? AND doc_id=?");
  st.text(1, collection);
  st.text(2, doc_id);
  std::vector<uint64_t> out;
  while (st.step() == SQLITE_ROW) out.push_back((uint64_t)st.col_int(0));
  return out;
}

size_t Store::delete_doc(const std::string& collection, const std::string& doc_id) {
  Stmt st(impl_->db, "DELETE FROM points WHERE collection=? AND doc_id=?");
  st.text(1, collection);
  st.text(2, doc_id);
  if (st.step() != SQLITE_DONE)
    throw IndexError(std::string("sqlite delete failed: ") + sqlite3_errmsg(impl_->db));
  return (size_t)sqlite3_changes(impl_->db);
}

size_t Store::count(const std::string& collection) const {
  Stmt st(impl_->db, "SELECT COUNT(*) FROM points WHERE collection=?");
  st.text(1, collection);
  if (st.step() != SQLITE_ROW) throw IndexError("sqlite count failed");
  return (size_t)st.col_int(0);
}

void Store::begin() { exec("BEGIN"); }
void Store::commit() { exec("COMMIT"); }
void Store::rollback() { exec("ROLLBACK"); }
