#include "index_manager.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

IndexManager::IndexManager(VectorStore& store, int batch_size)
  : store_(store), batch_size_(batch_size) {
  if (batch_size_ <= 0) throw std::invalid_argument("batch size must be positive");
}

void IndexManager::ensure_collection(const std::string& name, int dimension, Distance distance) {
  auto info = store_.collection_info(name);
  if (info) {
    if (info->dimension != dimension) {
      logger()->warn("collection '{}' exists with dimension {}, embedder produces {}",
                     name, info->dimension, dimension);
    }
    return;
  }
  logger()->info("creating collection '{}' (dim={}, distance={})",
                 name, dimension, distance_name(distance));
  store_.create_collection(name, CollectionSpec{dimension, distance});
}

void IndexManager::upsert(const std::string& name, const std::vector<DocumentChunk>& chunks,
                          const std::vector<std::vector<float>>& vectors, const Metadata& metadata) {
  if (chunks.size() != vectors.size())
    throw IndexError("upsert: " + std::to_string(chunks.size()) + " chunks but " +
                     std::to_string(vectors.size()) + " vectors");
  if (chunks.empty()) return;

  auto info = store_.collection_info(name);
  if (!info) throw IndexError("collection not found: " + name);

  for (size_t i = 0; i < chunks.size(); i += (size_t)batch_size_) {
    size_t end = std::min(chunks.size(), i + (size_t)batch_size_);
    std::vector<IndexedPoint> batch;
    batch.reserve(end - i);
    for (size_t j = i; j < end; ++j) {
      if ((int)vectors[j].size() != info->dimension) {
        throw IndexError("vector dimension " + std::to_string(vectors[j].size()) +
                         " does not match collection '" + name + "' dimension " +
                         std::to_string(info->dimension));
      }
      batch.push_back(IndexedPoint{chunks[j], vectors[j], metadata});
    }
    store_.upsert(name, batch);
  }
}

size_t IndexManager::count(const std::string& name) {
  return store_.count(name);
}

size_t IndexManager::delete_by_doc_id(const std::string& name, const std::string& doc_id) {
  size_t n = store_.delete_by_doc_id(name, doc_id);
  logger()->info("deleted {} points with doc_id {} from '{}'", n, doc_id, name);
  return n;
}

size_t ingest_chunks(Embedder& embedder, IndexManager& index, const std::string& collection,
                     const std::vector<DocumentChunk>& chunks, const Metadata& metadata) {
  const size_t bs = (size_t)index.batch_size();
  size_t written = 0;
  for (size_t i = 0; i < chunks.size(); i += bs) {
    size_t end = std::min(chunks.size(), i + bs);
    std::vector<DocumentChunk> batch(chunks.begin() + i, chunks.begin() + end);
    std::vector<std::string> texts;
    texts.reserve(batch.size());
    for (auto& c : batch) texts.push_back(c.text);

    auto emb = embedder.embed(texts);
    // the true output dimension is only known after the first batch
    if (i == 0) index.ensure_collection(collection, emb.dim);
    index.upsert(collection, batch, emb.vectors, metadata);
    written += batch.size();
    logger()->info("indexed {}/{} chunks", written, chunks.size());
  }
  return written;
}
