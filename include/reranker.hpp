#pragma once
#include "chunk.hpp"
#include <memory>
#include <string>
#include <vector>

// Pairwise relevance model: higher means more relevant.
class CrossEncoder {
public:
  virtual ~CrossEncoder() = default;
  virtual float score(const std::string& query, const std::string& document) = 0;
};

// GGUF reranker (rank pooling) through llama.cpp.
class LlamaCrossEncoder : public CrossEncoder {
public:
  explicit LlamaCrossEncoder(const std::string& model_path);
  ~LlamaCrossEncoder() override;

  float score(const std::string& query, const std::string& document) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Optional second pass over retrieval candidates. Without a model it is the
// identity; check available() before assuming anything was reordered.
class Reranker {
public:
  Reranker() = default;
  explicit Reranker(std::unique_ptr<CrossEncoder> model) : model_(std::move(model)) {}

  bool available() const { return model_ != nullptr; }

  // Stable sort by cross-encoder score, descending. The candidate score is
  // replaced by the cross-encoder score.
  std::vector<ScoredCandidate> rerank(const std::string& query,
                                      std::vector<ScoredCandidate> candidates) const;

private:
  std::unique_ptr<CrossEncoder> model_;
};

// Empty path gives an unavailable reranker; a model that fails to load is
// logged and also gives an unavailable reranker.
Reranker make_reranker(const std::string& model_path);
