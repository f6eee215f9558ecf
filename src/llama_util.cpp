#include "llama_util.hpp"
#include <mutex>
#include <stdexcept>

void ensure_llama_backend() {
  static std::once_flag once;
  std::call_once(once, [] { llama_backend_init(); });
}

llama_model* load_llama_model(const std::string& path, const char* who) {
  ensure_llama_backend();
  llama_model_params mp = llama_model_default_params();
  mp.n_gpu_layers = 0; // CPU
  llama_model* model = llama_model_load_from_file(path.c_str(), mp);
  if (!model) throw std::runtime_error(std::string(who) + ": failed to load model " + path);
  return model;
}

std::vector<llama_token> llama_tokens(const llama_vocab* vocab, const std::string& text,
                                      bool add_special, bool parse_special) {
  // first pass for length
  int32_t needed = -llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                                   nullptr, 0, add_special, parse_special);
  if (needed <= 0) return {};
  std::vector<llama_token> toks(needed);
  int32_t n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                             toks.data(), (int32_t)toks.size(), add_special, parse_special);
  if (n != needed) throw std::runtime_error("tokenize failed");
  return toks;
}

void batch_add(llama_batch& batch, llama_token tok, llama_pos pos, llama_seq_id seq, bool logits) {
  int i = batch.n_tokens;
  batch.token[i] = tok;
  batch.pos[i] = pos;
  batch.n_seq_id[i] = 1;
  batch.seq_id[i][0] = seq;
  batch.logits[i] = logits;
  batch.n_tokens++;
}

std::string token_to_string(const llama_vocab* vocab, llama_token tok) {
  char buf[256];
  int32_t n = llama_token_to_piece(vocab, tok, buf, sizeof(buf), /*lstrip*/ 0, /*special*/ false);
  if (n < 0) {
    std::string s(-n, '\0');
    n = llama_token_to_piece(vocab, tok, s.data(), (int32_t)s.size(), 0, false);
    s.resize(n > 0 ? n : 0);
    return s;
  }
  return std::string(buf, n);
}

int run_llama_batch(llama_context* ctx, const llama_model* model, llama_batch& batch) {
  if (llama_model_has_encoder(model) && !llama_model_has_decoder(model))
    return llama_encode(ctx, batch);
  return llama_decode(ctx, batch);
}
