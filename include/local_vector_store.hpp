#pragma once
#include "index.hpp"
#include "store.hpp"
#include "vector_store.hpp"
#include <map>
#include <memory>
#include <string>

// Embedded vector database: <dir>/guardrag.sqlite for payloads and the
// collection registry, <dir>/<collection>.hnsw per collection.
class LocalVectorStore : public VectorStore {
public:
  explicit LocalVectorStore(const std::string& dir);

  std::optional<CollectionSpec> collection_info(const std::string& name) override;
  void create_collection(const std::string& name, const CollectionSpec& spec) override;
  void upsert(const std::string& name, const std::vector<IndexedPoint>& points) override;
  std::vector<ScoredCandidate> search(const std::string& name,
                                      const std::vector<float>& query, int k) override;
  size_t count(const std::string& name) override;
  size_t delete_by_doc_id(const std::string& name, const std::string& doc_id) override;

private:
  Index* open_index(const std::string& name);
  void reload_index(const std::string& name);
  void publish_graph(const Index& idx);

  std::string dir_;
  Store store_;
  std::map<std::string, std::unique_ptr<Index>> indexes_;
};
