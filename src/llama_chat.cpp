// src/llama_chat.cpp
#include "chat_model.hpp"
#include "errors.hpp"
#include "llama_util.hpp"
#include "utf8.hpp"
#include <algorithm>
#include <llama.h>
#include <string>
#include <vector>

namespace {
// Used when the GGUF carries no chat template.
std::string plain_prompt(const std::vector<ChatMessage>& msgs) {
  std::string p;
  for (auto& m : msgs) {
    p.append(m.role == "system" ? "System" : m.role == "user" ? "User" : "Assistant");
    p.append(":\n");
    p.append(m.content);
    p.append("\n\n");
  }
  p.append("Assistant:\n");
  return p;
}
// Cap for a window sized from the model's training context.
const int kDefaultCtxCap = 8192;
} // namespace

struct LlamaChatModel::Impl {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 0;

  Impl(const std::string& model_path, int requested_ctx) {
    try {
      model = load_llama_model(model_path, "chat");
    } catch (const std::runtime_error& e) {
      throw ChatError(e.what());
    }
    const int trained = (int)llama_model_n_ctx_train(model);
    if (requested_ctx > 0) n_ctx = requested_ctx;
    else n_ctx = trained > 0 ? std::min(kDefaultCtxCap, trained) : 4096;

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.embeddings = false;
    ctx = llama_init_from_model(model, cp);
    if (!ctx) {
      llama_model_free(model);
      throw ChatError("chat: failed to create context");
    }

    vocab = llama_model_get_vocab(model);
  }

  ~Impl() {
    if (ctx) llama_free(ctx);
    if (model) llama_model_free(model);
  }

  std::string render(const std::vector<ChatMessage>& msgs) {
    const char* tmpl = llama_model_chat_template(model, nullptr);
    if (!tmpl) return plain_prompt(msgs);

    std::vector<llama_chat_message> chat;
    for (auto& m : msgs) chat.push_back({m.role.c_str(), m.content.c_str()});
    std::vector<char> buf(8192);
    int32_t n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), /*add_ass=*/true,
                                          buf.data(), (int32_t)buf.size());
    if (n < 0) return plain_prompt(msgs);
    if (n > (int32_t)buf.size()) {
      buf.resize(n);
      n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buf.data(), (int32_t)buf.size());
    }
    return std::string(buf.data(), n);
  }

  llama_sampler* make_sampler(const std::string& grammar) {
    llama_sampler* chain = llama_sampler_chain_init(llama_sampler_chain_default_params());
    if (!grammar.empty()) {
      llama_sampler* g = llama_sampler_init_grammar(vocab, grammar.c_str(), "root");
      if (!g) {
        llama_sampler_free(chain);
        throw ChatError("chat: invalid grammar");
      }
      llama_sampler_chain_add(chain, g);
    }
    llama_sampler_chain_add(chain, llama_sampler_init_greedy());
    return chain;
  }

  std::string generate(const ChatRequest& req) {
    std::string prompt = render(req.messages);
    auto toks = llama_tokens(vocab, prompt, /*add_special=*/true, /*parse_special=*/true);
    if (toks.empty()) throw ChatError("chat: empty prompt");
    if ((int)toks.size() + req.max_tokens > n_ctx) throw ChatError("chat: prompt exceeds context window");

    llama_memory_clear(llama_get_memory(ctx), true);
    llama_sampler* smpl = make_sampler(req.grammar);

    std::string out;
    llama_batch batch = llama_batch_get_one(toks.data(), (int32_t)toks.size());
    llama_token tok = 0;
    for (int t = 0; t < req.max_tokens; ++t) {
      if (llama_decode(ctx, batch) != 0) {
        llama_sampler_free(smpl);
        throw ChatError("chat: llama_decode failed");
      }
      tok = llama_sampler_sample(smpl, ctx, -1);
      if (llama_vocab_is_eog(vocab, tok)) break;
      out += token_to_string(vocab, tok);
      batch = llama_batch_get_one(&tok, 1);
    }
    llama_sampler_free(smpl);
    // the token cap can cut a multi-byte character in half
    return drop_invalid_utf8(out);
  }
};

LlamaChatModel::LlamaChatModel(const std::string& model_path, int n_ctx)
  : impl_(new Impl(model_path, n_ctx)), path_(model_path) {}

LlamaChatModel::~LlamaChatModel() = default;

std::string LlamaChatModel::complete(const ChatRequest& req) {
  return impl_->generate(req);
}

int LlamaChatModel::context_tokens() const {
  return impl_->n_ctx;
}
