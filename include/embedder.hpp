#pragma once
#include <memory>
#include <string>
#include <vector>

struct EmbeddingBatch {
  std::vector<std::vector<float>> vectors; // same order as the input texts
  int dim = 0;
};

class Embedder {
public:
  virtual ~Embedder() = default;

  // Throws EmbeddingError on an empty batch or when the model fails.
  virtual EmbeddingBatch embed(const std::vector<std::string>& texts) = 0;
  virtual std::string name() const = 0;
};

// GGUF embedding model through llama.cpp. Vectors are pooled per sequence
// and L2-normalized.
class LlamaEmbedder : public Embedder {
public:
  explicit LlamaEmbedder(const std::string& embed_model_path);
  ~LlamaEmbedder() override;

  EmbeddingBatch embed(const std::vector<std::string>& texts) override;
  std::string name() const override { return path_; }
  int dim() const { return dim_; }

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::string path_;
  int dim_;
};

// Bag-of-words hashing trick: lowercase alphanumeric tokens hashed into a
// fixed number of buckets, then L2-normalized. Needs no model file.
class HashEmbedder : public Embedder {
public:
  explicit HashEmbedder(int dim=4096) : dim_(dim) {}

  EmbeddingBatch embed(const std::vector<std::string>& texts) override;
  std::string name() const override { return "hash"; }

  std::vector<float> encode(const std::string& text) const;

private:
  int dim_;
};

// "hash" (or empty) selects HashEmbedder, anything else is a GGUF path.
std::unique_ptr<Embedder> make_embedder(const std::string& model);
