#include "reranker.hpp"
#include "logging.hpp"
#include <algorithm>
#include <utility>

std::vector<ScoredCandidate> Reranker::rerank(const std::string& query,
                                              std::vector<ScoredCandidate> candidates) const {
  if (!model_ || candidates.empty()) return candidates;

  for (auto& c : candidates) c.score = model_->score(query, c.payload.text);
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const ScoredCandidate& a, const ScoredCandidate& b) { return a.score > b.score; });
  return candidates;
}

Reranker make_reranker(const std::string& model_path) {
  if (model_path.empty()) return Reranker();
  try {
    return Reranker(std::make_unique<LlamaCrossEncoder>(model_path));
  } catch (const std::exception& e) {
    logger()->warn("reranker unavailable: {}", e.what());
    return Reranker();
  }
}
