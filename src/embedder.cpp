// src/embedder.cpp
#include "embedder.hpp"
#include "errors.hpp"
#include "llama_util.hpp"
#include <llama.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

struct LlamaEmbedder::Impl {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 512;
  int dim = 0;

  explicit Impl(const std::string& model_path) {
    try {
      model = load_llama_model(model_path, "embedder");
    } catch (const std::runtime_error& e) {
      throw EmbeddingError(e.what());
    }

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;
    cp.embeddings = true;                // IMPORTANT for embeddings
    cp.pooling_type = LLAMA_POOLING_TYPE_MEAN;
    ctx = llama_init_from_model(model, cp);
    if (!ctx) {
      llama_model_free(model);
      throw EmbeddingError("embedder: failed to create context");
    }

    vocab = llama_model_get_vocab(model);
    dim = llama_model_n_embd(model);
    if (dim <= 0) {
      llama_free(ctx);
      llama_model_free(model);
      throw EmbeddingError("embedder: invalid embedding dim");
    }
  }

  ~Impl() {
    if (ctx) llama_free(ctx);
    if (model) llama_model_free(model);
  }

  std::vector<float> encode_text(const std::string& text) {
    auto toks = llama_tokens(vocab, text, /*add_special=*/true);
    if (toks.empty()) throw EmbeddingError("embedder: text produced no tokens");
    if ((int)toks.size() > n_ctx) toks.resize(n_ctx);

    llama_memory_clear(llama_get_memory(ctx), true);
    llama_batch batch = llama_batch_init((int)toks.size(), /*embd*/ 0, /*n_seq*/ 1);
    for (int i = 0; i < (int)toks.size(); ++i) {
      batch_add(batch, toks[i], /*pos*/ i, /*seq*/ 0, /*logits*/ true);
    }
    int rc = run_llama_batch(ctx, model, batch);
    llama_batch_free(batch);
    if (rc != 0) throw EmbeddingError("embedder: llama batch failed");

    const float* emb = llama_get_embeddings_seq(ctx, 0);
    if (!emb) throw EmbeddingError("embedder: embeddings null");

    std::vector<float> v(emb, emb + dim);
    // L2 normalize
    double s = 0.0; for (float x : v) s += (double)x * (double)x;
    float norm = (float)std::sqrt(std::max(s, 1e-12));
    for (auto& x : v) x /= norm;
    return v;
  }
};

LlamaEmbedder::LlamaEmbedder(const std::string& embed_model_path)
  : impl_(new Impl(embed_model_path)), path_(embed_model_path) {
  dim_ = impl_->dim;
}

LlamaEmbedder::~LlamaEmbedder() = default;

EmbeddingBatch LlamaEmbedder::embed(const std::vector<std::string>& texts) {
  if (texts.empty()) throw EmbeddingError("embed: empty batch");
  EmbeddingBatch out;
  out.dim = dim_;
  out.vectors.reserve(texts.size());
  for (auto& t : texts) out.vectors.push_back(impl_->encode_text(t));
  return out;
}
