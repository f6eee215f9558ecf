#pragma once
#include "chunk.hpp"
#include <string>
#include <vector>

// Keys accepted in caller metadata. Everything else, including the payload's
// own fields (text, doc_id, source, chunk_index), is rejected.
const std::vector<std::string>& allowed_metadata_keys();

// Parse a JSON object of scalar values into Metadata. Numbers and booleans
// are stored in their JSON spelling. Throws IngestionError on bad JSON, a
// non-object, nested values, unknown keys or an unknown severity.
Metadata parse_metadata(const std::string& json_text);

// "id" from the metadata when present, else a fresh UUID.
std::string doc_id_for(const Metadata& md);
