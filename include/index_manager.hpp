#pragma once
#include "chunk.hpp"
#include "embedder.hpp"
#include "vector_store.hpp"
#include <string>
#include <vector>

// Collection lifecycle and batched writes on top of a VectorStore.
class IndexManager {
public:
  explicit IndexManager(VectorStore& store, int batch_size=128);

  // No-op when the collection already exists, whatever its dimension.
  void ensure_collection(const std::string& name, int dimension,
                         Distance distance = Distance::Cosine);

  // Payload = {text, doc_id, source, chunk_index} + metadata, overwrite by
  // chunk id. Vectors must match the collection dimension (IndexError). A
  // failing batch aborts the call; earlier batches stay written.
  void upsert(const std::string& name, const std::vector<DocumentChunk>& chunks,
              const std::vector<std::vector<float>>& vectors, const Metadata& metadata = {});

  size_t count(const std::string& name);
  size_t delete_by_doc_id(const std::string& name, const std::string& doc_id);

  int batch_size() const { return batch_size_; }

private:
  VectorStore& store_;
  int batch_size_;
};

// Ingestion path: embed in batches, create the collection from the first
// batch's dimension, upsert each batch. Returns the number of chunks written.
size_t ingest_chunks(Embedder& embedder, IndexManager& index, const std::string& collection,
                     const std::vector<DocumentChunk>& chunks, const Metadata& metadata = {});
