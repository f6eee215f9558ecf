#include "embedder.hpp"
#include "errors.hpp"
#include <cctype>
#include <cmath>
#include <functional>

std::vector<float> HashEmbedder::encode(const std::string& text) const {
  std::vector<float> vec(dim_, 0.0f);
  auto bump = [&](const std::string& token) {
    size_t h = std::hash<std::string>{}(token) % (size_t)dim_;
    vec[h] += 1.0f;
  };

  std::string token;
  for (char c : text) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else if (!token.empty()) {
      bump(token);
      token.clear();
    }
  }
  if (!token.empty()) bump(token);

  float norm = 0.0f;
  for (float v : vec) norm += v * v;
  if (norm > 0.0f) {
    norm = std::sqrt(norm);
    for (float& v : vec) v /= norm;
  }
  return vec;
}

EmbeddingBatch HashEmbedder::embed(const std::vector<std::string>& texts) {
  if (texts.empty()) throw EmbeddingError("embed: empty batch");
  EmbeddingBatch out;
  out.dim = dim_;
  out.vectors.reserve(texts.size());
  for (auto& t : texts) out.vectors.push_back(encode(t));
  return out;
}

std::unique_ptr<Embedder> make_embedder(const std::string& model) {
  if (model.empty() || model == "hash") return std::make_unique<HashEmbedder>();
  return std::make_unique<LlamaEmbedder>(model);
}
