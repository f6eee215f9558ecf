#pragma once
#include "chunk.hpp"
#include "vector_store.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct CollectionRow {
  std::string name;
  CollectionSpec spec;
  int m = 16;
  int ef_construction = 200;
};

// SQLite side of the local vector store: collection registry plus one row
// per point holding its payload and the hnswlib label of its vector.
class Store {
public:
  explicit Store(const std::string& sqlite_path);
  ~Store();
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  void ensure_schema();

  std::optional<CollectionRow> get_collection(const std::string& name) const;
  void insert_collection(const CollectionRow& row);

  // Insert or overwrite the point with this chunk id; returns its label.
  uint64_t upsert_point(const std::string& collection, const IndexedPoint& p);
  std::optional<Payload> get_payload(const std::string& collection, uint64_t label) const;
  std::vector<uint64_t> labels_for_doc(const std::string& collection, const std::string& doc_id) const;
  size_t delete_doc(const std::string& collection, const std::string& doc_id);
  size_t count(const std::string& collection) const;

  void begin();
  void commit();
  void rollback();

private:
  void exec(const char* sql);
  struct Impl;
  Impl* impl_;
};
