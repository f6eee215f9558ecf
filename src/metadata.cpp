#include "metadata.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;
using std::string;

const std::vector<string>& allowed_metadata_keys() {
  static const std::vector<string> keys = {
    "id", "name", "description", "keywords", "severity", "category", "version", "owner"};
  return keys;
}

static bool is_allowed(const string& key) {
  auto& keys = allowed_metadata_keys();
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

Metadata parse_metadata(const string& json_text) {
  Metadata md;
  if (json_text.empty()) return md;

  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw IngestionError(string("invalid JSON in metadata: ") + e.what());
  }
  if (!j.is_object()) throw IngestionError("metadata must be a JSON object");

  for (auto it = j.begin(); it != j.end(); ++it) {
    const string& key = it.key();
    if (!is_allowed(key)) throw IngestionError("metadata key not allowed: " + key);
    const json& v = it.value();
    if (v.is_string()) md[key] = v.get<string>();
    else if (v.is_number() || v.is_boolean()) md[key] = v.dump();
    else throw IngestionError("metadata value for '" + key + "' must be a string, number or boolean");
  }

  auto sev = md.find("severity");
  if (sev != md.end()) {
    static const char* levels[] = {"low", "medium", "high", "critical"};
    if (std::none_of(std::begin(levels), std::end(levels),
                     [&](const char* l) { return sev->second == l; }))
      throw IngestionError("unknown severity: " + sev->second);
  }
  auto id = md.find("id");
  if (id != md.end() && id->second.empty()) throw IngestionError("metadata id must not be empty");
  return md;
}

string doc_id_for(const Metadata& md) {
  auto it = md.find("id");
  return it != md.end() ? it->second : make_uuid();
}
