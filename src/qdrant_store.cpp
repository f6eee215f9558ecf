#include "qdrant_store.hpp"
#include "errors.hpp"

using json = nlohmann::json;

QdrantStore::QdrantStore(std::string base_url, const std::string& api_key, long timeout_ms)
  : base_url_(std::move(base_url)), http_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
  if (!api_key.empty()) http_.add_header("api-key", api_key);
}

std::string QdrantStore::collection_url(const std::string& name) const {
  return base_url_ + "/collections/" + name;
}

json QdrantStore::call(const std::string& method, const std::string& url, const json& body) const {
  HttpResponse r;
  try {
    r = http_.request(method, url, body.is_null() ? "" : body.dump());
  } catch (const HttpError& e) {
    throw IndexError(std::string("qdrant: ") + e.what());
  }
  if (r.status < 200 || r.status >= 300) {
    throw IndexError("qdrant: " + method + " " + url + " returned " + std::to_string(r.status) +
                     ": " + r.body.substr(0, 300));
  }
  auto j = json::parse(r.body, nullptr, /*allow_exceptions=*/false);
  if (!j.is_object()) throw IndexError("qdrant: unparsable response from " + url);
  return j;
}

std::optional<CollectionSpec> QdrantStore::collection_info(const std::string& name) {
  HttpResponse r;
  try {
    r = http_.request("GET", collection_url(name));
  } catch (const HttpError& e) {
    throw IndexError(std::string("qdrant: ") + e.what());
  }
  if (r.status == 404) return std::nullopt;
  if (r.status != 200) throw IndexError("qdrant: get collection returned " + std::to_string(r.status));

  auto j = json::parse(r.body, nullptr, false);
  if (!j.is_object()) throw IndexError("qdrant: unparsable collection info for " + name);
  CollectionSpec spec;
  auto vectors = j.value("/result/config/params/vectors"_json_pointer, json::object());
  spec.dimension = vectors.value("size", 0);
  try {
    spec.distance = parse_distance(vectors.value("distance", std::string("Cosine")));
  } catch (const IndexError&) {
    spec.distance = Distance::Cosine; // Manhattan and friends are not produced here
  }
  distances_[name] = spec.distance;
  return spec;
}

void QdrantStore::create_collection(const std::string& name, const CollectionSpec& spec) {
  json body = {
    {"vectors", {{"size", spec.dimension}, {"distance", distance_name(spec.distance)}}},
    {"optimizers_config", {{"default_segment_number", 2}}},
  };
  call("PUT", collection_url(name), body);
  distances_[name] = spec.distance;
}

json payload_json(const IndexedPoint& p) {
  json payload = json::object();
  for (auto& kv : p.metadata) payload[kv.first] = kv.second;
  payload["text"] = p.chunk.text;
  payload["doc_id"] = p.chunk.doc_id;
  payload["source"] = p.chunk.source;
  payload["chunk_index"] = p.chunk.chunk_index;
  return payload;
}

Payload payload_from_json(const std::string& id, const json& j) {
  Payload p;
  p.id = id;
  if (!j.is_object()) return p;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto& k = it.key();
    const auto& v = it.value();
    if (k == "text") p.text = v.is_string() ? v.get<std::string>() : "";
    else if (k == "doc_id") p.doc_id = v.is_string() ? v.get<std::string>() : v.dump();
    else if (k == "source") p.source = v.is_string() ? v.get<std::string>() : "";
    else if (k == "chunk_index") p.chunk_index = v.is_number_integer() ? v.get<int>() : -1;
    else p.metadata[k] = v.is_string() ? v.get<std::string>() : v.dump();
  }
  return p;
}

void QdrantStore::upsert(const std::string& name, const std::vector<IndexedPoint>& points) {
  json arr = json::array();
  for (auto& p : points) {
    arr.push_back({{"id", p.chunk.id}, {"vector", p.vector}, {"payload", payload_json(p)}});
  }
  call("PUT", collection_url(name) + "/points?wait=true", json{{"points", arr}});
}

std::vector<ScoredCandidate> QdrantStore::search(const std::string& name,
                                                 const std::vector<float>& query, int k) {
  auto known = distances_.find(name);
  Distance distance;
  if (known != distances_.end()) {
    distance = known->second;
  } else {
    auto info = collection_info(name);
    if (!info) return {};
    distance = info->distance;
  }

  json body = {{"vector", query}, {"limit", k}, {"with_payload", true}, {"with_vector", false}};
  auto j = call("POST", collection_url(name) + "/points/search", body);

  std::vector<ScoredCandidate> out;
  for (auto& hit : j.value("result", json::array())) {
    const auto& id = hit.at("id");
    ScoredCandidate c;
    c.payload = payload_from_json(id.is_string() ? id.get<std::string>() : id.dump(),
                                  hit.value("payload", json::object()));
    c.score = hit.value("score", 0.0f);
    // Euclid scores come back as distances, smallest first
    if (distance == Distance::Euclid) c.score = 1.0f / (1.0f + c.score);
    out.push_back(std::move(c));
  }
  return out;
}

size_t QdrantStore::count(const std::string& name) {
  auto j = call("POST", collection_url(name) + "/points/count", json{{"exact", true}});
  return j.value("/result/count"_json_pointer, (size_t)0);
}

size_t QdrantStore::delete_by_doc_id(const std::string& name, const std::string& doc_id) {
  // nothing to delete from a collection that does not exist
  if (!collection_info(name)) return 0;

  json cond = json::object();
  cond["key"] = "doc_id";
  cond["match"] = {{"value", doc_id}};
  json filter = json::object();
  filter["must"] = json::array({cond});
  size_t before = count(name);
  call("POST", collection_url(name) + "/points/delete?wait=true", json{{"filter", filter}});
  size_t after = count(name);
  return before > after ? before - after : 0;
}
