#pragma once
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

struct ChatMessage {
  std::string role;    // "system" | "user" | "assistant"
  std::string content;
};

struct ChatRequest {
  std::vector<ChatMessage> messages;
  float temperature = 0.2f;
  int max_tokens = 512;

  // Structured output. When schema is set the hosted API is asked for
  // response_format json_schema; a local model is constrained by grammar.
  std::string schema_name;
  nlohmann::json schema;   // null for free text
  std::string grammar;     // GBNF, root rule "root"
};

// Chat completion capability. complete() returns the assistant text and
// throws ChatError on any failure, including timeouts.
class ChatModel {
public:
  virtual ~ChatModel() = default;
  virtual std::string complete(const ChatRequest& req) = 0;
  virtual std::string name() const = 0;

  // Prompt plus reply budget in tokens; 0 when the model sets no usable limit.
  virtual int context_tokens() const { return 0; }
};

// Local GGUF instruct model through llama.cpp, greedy decoding. n_ctx 0
// sizes the window from the model's training context, capped at 8192.
class LlamaChatModel : public ChatModel {
public:
  explicit LlamaChatModel(const std::string& model_path, int n_ctx=0);
  ~LlamaChatModel() override;

  std::string complete(const ChatRequest& req) override;
  std::string name() const override { return path_; }
  int context_tokens() const override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::string path_;
};

// OpenAI-compatible chat completions endpoint (Groq by default).
class GroqChatModel : public ChatModel {
public:
  GroqChatModel(std::string api_key, std::string model, std::string base_url, long timeout_ms=30000);

  std::string complete(const ChatRequest& req) override;
  std::string name() const override { return model_; }

  // Request body for req; exposed for tests.
  nlohmann::json request_body(const ChatRequest& req) const;

private:
  std::string api_key_, model_, base_url_;
  long timeout_ms_;
};
