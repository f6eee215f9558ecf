#include "retriever.hpp"
#include "errors.hpp"
#include <algorithm>

std::vector<ScoredCandidate> Retriever::search(const std::string& collection,
                                               const std::string& query_text, int top_k) {
  if (top_k < 1) throw std::invalid_argument("top_k must be at least 1");

  auto emb = embedder_.embed({query_text});
  if (emb.vectors.size() != 1) throw EmbeddingError("query embedding returned no vector");

  auto hits = store_.search(collection, emb.vectors[0], top_k);
  std::stable_sort(hits.begin(), hits.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
    return a.score > b.score;
  });
  if ((int)hits.size() > top_k) hits.resize(top_k);
  return hits;
}
