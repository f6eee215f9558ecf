#include "reranker.hpp"
#include "llama_util.hpp"
#include <llama.h>
#include <stdexcept>

struct LlamaCrossEncoder::Impl {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 512;

  explicit Impl(const std::string& model_path) {
    model = load_llama_model(model_path, "reranker");

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;
    cp.embeddings = true;
    cp.pooling_type = LLAMA_POOLING_TYPE_RANK;
    ctx = llama_init_from_model(model, cp);
    if (!ctx) {
      llama_model_free(model);
      throw std::runtime_error("reranker: failed to create context");
    }
    vocab = llama_model_get_vocab(model);
  }

  ~Impl() {
    if (ctx) llama_free(ctx);
    if (model) llama_model_free(model);
  }

  // [BOS] query [EOS] [SEP] document [EOS], the layout rerank GGUFs expect
  std::vector<llama_token> pair_tokens(const std::string& query, const std::string& doc) {
    auto toks = llama_tokens(vocab, query, /*add_special=*/true);
    llama_token sep = llama_vocab_sep(vocab);
    if (sep != LLAMA_TOKEN_NULL) toks.push_back(sep);
    auto d = llama_tokens(vocab, doc, /*add_special=*/false);
    toks.insert(toks.end(), d.begin(), d.end());
    llama_token eos = llama_vocab_eos(vocab);
    if (eos != LLAMA_TOKEN_NULL) toks.push_back(eos);
    if ((int)toks.size() > n_ctx) toks.resize(n_ctx);
    return toks;
  }

  float score(const std::string& query, const std::string& doc) {
    auto toks = pair_tokens(query, doc);
    llama_memory_clear(llama_get_memory(ctx), true);
    llama_batch batch = llama_batch_init((int)toks.size(), 0, 1);
    for (int i = 0; i < (int)toks.size(); ++i) batch_add(batch, toks[i], i, 0, true);
    int rc = run_llama_batch(ctx, model, batch);
    llama_batch_free(batch);
    if (rc != 0) throw std::runtime_error("reranker: llama batch failed");

    const float* out = llama_get_embeddings_seq(ctx, 0);
    if (!out) throw std::runtime_error("reranker: no rank output");
    return out[0];
  }
};

LlamaCrossEncoder::LlamaCrossEncoder(const std::string& model_path) : impl_(new Impl(model_path)) {}
LlamaCrossEncoder::~LlamaCrossEncoder() = default;

float LlamaCrossEncoder::score(const std::string& query, const std::string& document) {
  return impl_->score(query, document);
}
