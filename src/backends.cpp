#include "backends.hpp"
#include "local_vector_store.hpp"
#include "logging.hpp"
#include "qdrant_store.hpp"

std::unique_ptr<VectorStore> make_vector_store(const Config& cfg) {
  if (!cfg.qdrant_url.empty()) {
    logger()->debug("vector store: qdrant at {}", cfg.qdrant_url);
    return std::make_unique<QdrantStore>(cfg.qdrant_url, cfg.qdrant_api_key, cfg.timeout_ms);
  }
  logger()->debug("vector store: local at {}", cfg.index_dir);
  return std::make_unique<LocalVectorStore>(cfg.index_dir);
}

std::unique_ptr<ChatModel> make_chat_model(const Config& cfg) {
  if (!cfg.groq_api_key.empty())
    return std::make_unique<GroqChatModel>(cfg.groq_api_key, cfg.groq_model, cfg.groq_base_url,
                                           cfg.timeout_ms);
  if (!cfg.chat_model.empty())
    return std::make_unique<LlamaChatModel>(cfg.chat_model, cfg.chat_ctx);
  logger()->warn("no chat model configured (set GROQ_API_KEY or CHAT_MODEL)");
  return nullptr;
}
