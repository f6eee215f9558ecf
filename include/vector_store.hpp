#pragma once
#include "chunk.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class Distance { Cosine, Dot, Euclid };

// "Cosine", "Dot", "Euclid" (the Qdrant spelling).
std::string distance_name(Distance d);
Distance parse_distance(const std::string& name);

struct CollectionSpec {
  int dimension = 0;
  Distance distance = Distance::Cosine;
};

// The vector database capability: named collections of points with payload.
// Every method throws IndexError when the backend fails.
class VectorStore {
public:
  virtual ~VectorStore() = default;

  virtual std::optional<CollectionSpec> collection_info(const std::string& name) = 0;
  virtual void create_collection(const std::string& name, const CollectionSpec& spec) = 0;

  // Overwrite-by-id. The caller has already checked vector dimensions.
  virtual void upsert(const std::string& name, const std::vector<IndexedPoint>& points) = 0;

  // Nearest neighbours, highest score first, at most k results, no vectors.
  virtual std::vector<ScoredCandidate> search(const std::string& name,
                                              const std::vector<float>& query, int k) = 0;

  virtual size_t count(const std::string& name) = 0;

  // Number of points removed.
  virtual size_t delete_by_doc_id(const std::string& name, const std::string& doc_id) = 0;
};
