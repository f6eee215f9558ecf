#pragma once
// Shared plumbing for the llama.cpp-backed embedder, cross-encoder and chat model.
#include <llama.h>
#include <string>
#include <vector>

// llama_backend_init exactly once per process.
void ensure_llama_backend();

llama_model* load_llama_model(const std::string& path, const char* who);

std::vector<llama_token> llama_tokens(const llama_vocab* vocab, const std::string& text,
                                      bool add_special, bool parse_special=false);

void batch_add(llama_batch& batch, llama_token tok, llama_pos pos, llama_seq_id seq, bool logits);

std::string token_to_string(const llama_vocab* vocab, llama_token tok);

// Encoder-only models (BERT family) go through llama_encode.
int run_llama_batch(llama_context* ctx, const llama_model* model, llama_batch& batch);
