#pragma once
#include "http_client.hpp"
#include "vector_store.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

// Qdrant over its REST API (port 6333). Point ids are the chunk UUIDs.
// Searching a collection that does not exist returns no candidates.
class QdrantStore : public VectorStore {
public:
  QdrantStore(std::string base_url, const std::string& api_key, long timeout_ms=30000);

  std::optional<CollectionSpec> collection_info(const std::string& name) override;
  void create_collection(const std::string& name, const CollectionSpec& spec) override;
  void upsert(const std::string& name, const std::vector<IndexedPoint>& points) override;
  std::vector<ScoredCandidate> search(const std::string& name,
                                      const std::vector<float>& query, int k) override;
  size_t count(const std::string& name) override;
  size_t delete_by_doc_id(const std::string& name, const std::string& doc_id) override;

  const std::string& url() const { return base_url_; }

private:
  std::string collection_url(const std::string& name) const;
  // Throws IndexError unless the response is 2xx with a JSON body.
  nlohmann::json call(const std::string& method, const std::string& url,
                      const nlohmann::json& body) const;

  std::string base_url_;
  HttpClient http_;
  std::map<std::string, Distance> distances_;
};

// Payload object as stored in Qdrant, and back.
nlohmann::json payload_json(const IndexedPoint& p);
Payload payload_from_json(const std::string& id, const nlohmann::json& j);
