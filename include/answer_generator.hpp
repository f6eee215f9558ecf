#pragma once
#include "chat_model.hpp"
#include <string>
#include <vector>

// Query answering over retrieved contexts. Without a model, or when the
// model call fails, returns the extractive fallback.
class AnswerGenerator {
public:
  explicit AnswerGenerator(ChatModel* model) : model_(model) {}

  std::string generate(const std::string& query, const std::vector<std::string>& contexts) const;
  ChatRequest build_request(const std::string& query, const std::vector<std::string>& contexts) const;

private:
  ChatModel* model_;
};

// Top three contexts joined by newlines plus a "no LLM" marker.
std::string extractive_answer(const std::vector<std::string>& contexts);
