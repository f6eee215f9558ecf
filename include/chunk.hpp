#pragma once
#include <map>
#include <string>
#include <vector>

// Caller-supplied key/value pairs merged into every point payload.
// Keys are validated by parse_metadata (metadata.hpp).
using Metadata = std::map<std::string, std::string>;

struct DocumentChunk {
  std::string id;         // unique per chunk (UUIDv4)
  std::string text;       // whitespace-normalized, non-empty
  std::string doc_id;     // groups chunks of one source document
  std::string source;     // origin path
  int chunk_index = 0;    // 0-based, contiguous per doc_id
};

struct IndexedPoint {
  DocumentChunk chunk;
  std::vector<float> vector;
  Metadata metadata;
};

// What comes back from the index: chunk fields plus the stored metadata.
struct Payload {
  std::string id;
  std::string text;
  std::string doc_id;
  std::string source;
  int chunk_index = -1;
  Metadata metadata;
};

struct ScoredCandidate {
  Payload payload;
  float score = 0.0f;
};

std::string make_uuid();
