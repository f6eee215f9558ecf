#pragma once
#include "chat_model.hpp"
#include "config.hpp"
#include "vector_store.hpp"
#include <memory>

// Qdrant when qdrant_url is set, otherwise the on-disk store in index_dir.
std::unique_ptr<VectorStore> make_vector_store(const Config& cfg);

// Groq when an API key is set, a local GGUF model when chat_model is set,
// otherwise null (logged).
std::unique_ptr<ChatModel> make_chat_model(const Config& cfg);
