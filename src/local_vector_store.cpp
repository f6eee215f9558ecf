#include "local_vector_store.hpp"
#include "errors.hpp"
#include <re2/re2.h>
#include <filesystem>

namespace fs = std::filesystem;

static std::string prepare_dir(const std::string& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw IndexError("cannot create index dir " + dir + ": " + ec.message());
  return dir;
}

static std::string staged_path(const Index& idx) {
  return idx.path() + ".tmp";
}

static void check_name(const std::string& name) {
  static const RE2 valid("[A-Za-z0-9_.-]{1,128}");
  if (!RE2::FullMatch(name, valid) || name[0] == '.')
    throw IndexError("invalid collection name: '" + name + "'");
}

LocalVectorStore::LocalVectorStore(const std::string& dir)
  : dir_(prepare_dir(dir)), store_((fs::path(dir_) / "guardrag.sqlite").string()) {}

std::optional<CollectionSpec> LocalVectorStore::collection_info(const std::string& name) {
  check_name(name);
  auto row = store_.get_collection(name);
  if (!row) return std::nullopt;
  return row->spec;
}

void LocalVectorStore::create_collection(const std::string& name, const CollectionSpec& spec) {
  check_name(name);
  if (spec.dimension <= 0) throw IndexError("collection dimension must be positive");
  CollectionRow row;
  row.name = name;
  row.spec = spec;
  store_.insert_collection(row);

  // an orphaned graph from an earlier collection of the same name is stale
  std::error_code ec;
  fs::remove(fs::path(dir_) / (name + ".hnsw"), ec);
  fs::remove(fs::path(dir_) / (name + ".hnsw.tmp"), ec);
  indexes_.erase(name);
}

Index* LocalVectorStore::open_index(const std::string& name) {
  auto it = indexes_.find(name);
  if (it != indexes_.end()) return it->second.get();

  auto row = store_.get_collection(name);
  if (!row) return nullptr;
  auto idx = std::make_unique<Index>((fs::path(dir_) / (name + ".hnsw")).string(),
                                     row->spec.dimension, row->spec.distance,
                                     row->m, row->ef_construction);
  idx->load();
  Index* raw = idx.get();
  indexes_[name] = std::move(idx);
  return raw;
}

void LocalVectorStore::reload_index(const std::string& name) {
  indexes_.erase(name);
  open_index(name);
}

// The staged graph replaces the live file only after COMMIT succeeded.
void LocalVectorStore::publish_graph(const Index& idx) {
  std::error_code ec;
  fs::rename(staged_path(idx), idx.path(), ec);
  if (ec) throw IndexError("cannot replace " + idx.path() + ": " + ec.message());
}

void LocalVectorStore::upsert(const std::string& name, const std::vector<IndexedPoint>& points) {
  check_name(name);
  Index* idx = open_index(name);
  if (!idx) throw IndexError("collection not found: " + name);

  // one transaction per call; on failure the sqlite rows roll back, the
  // staged graph is dropped and the graph is reloaded from its last saved state
  store_.begin();
  try {
    for (auto& p : points) {
      uint64_t label = store_.upsert_point(name, p);
      idx->add(label, p.vector);
    }
    idx->save(staged_path(*idx));
    store_.commit();
  } catch (const std::exception&) {
    std::error_code ec;
    fs::remove(staged_path(*idx), ec);
    store_.rollback();
    reload_index(name);
    throw;
  }
  publish_graph(*idx);
}

std::vector<ScoredCandidate> LocalVectorStore::search(const std::string& name,
                                                      const std::vector<float>& query, int k) {
  check_name(name);
  Index* idx = open_index(name);
  if (!idx) return {};

  std::vector<ScoredCandidate> out;
  for (auto& hit : idx->search(query, k)) {
    auto payload = store_.get_payload(name, hit.first);
    if (!payload) continue;
    out.push_back(ScoredCandidate{std::move(*payload), hit.second});
  }
  return out;
}

size_t LocalVectorStore::count(const std::string& name) {
  check_name(name);
  return store_.count(name);
}

size_t LocalVectorStore::delete_by_doc_id(const std::string& name, const std::string& doc_id) {
  check_name(name);
  Index* idx = open_index(name);
  if (!idx) return 0;

  size_t n = 0;
  store_.begin();
  try {
    for (uint64_t label : store_.labels_for_doc(name, doc_id)) idx->remove(label);
    n = store_.delete_doc(name, doc_id);
    idx->save(staged_path(*idx));
    store_.commit();
  } catch (const std::exception&) {
    std::error_code ec;
    fs::remove(staged_path(*idx), ec);
    store_.rollback();
    reload_index(name);
    throw;
  }
  publish_graph(*idx);
  return n;
}
