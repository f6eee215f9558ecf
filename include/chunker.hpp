#pragma once
#include "chunk.hpp"
#include <string>
#include <vector>

// Collapse whitespace runs to a single space and trim both ends.
std::string normalize_ws(const std::string& text);

// Sliding window of words (size, overlap). The last chunk always ends on the
// last word. Returns no chunks for empty text.
std::vector<std::string> chunk_words(const std::string& text, int size=800, int overlap=120);

// Chunk already-normalized document text into DocumentChunks sharing doc_id.
std::vector<DocumentChunk> chunk_document(const std::string& text,
                                          const std::string& doc_id,
                                          const std::string& source,
                                          int size=800, int overlap=120);
