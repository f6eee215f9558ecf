#pragma once
#include "chunk.hpp"
#include "embedder.hpp"
#include "vector_store.hpp"
#include <string>
#include <vector>

class Retriever {
public:
  Retriever(Embedder& embedder, VectorStore& store) : embedder_(embedder), store_(store) {}

  // Highest score first, at most top_k candidates. top_k < 1 throws
  // std::invalid_argument; embedding and index failures propagate.
  std::vector<ScoredCandidate> search(const std::string& collection,
                                      const std::string& query_text, int top_k);

private:
  Embedder& embedder_;
  VectorStore& store_;
};
