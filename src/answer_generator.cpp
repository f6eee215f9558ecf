#include "answer_generator.hpp"
#include "logging.hpp"

static const char* SYSTEM_INSTRUCTIONS =
"You are a helpful RAG assistant. Answer the user using only the provided context snippets. "
"If the answer is not present, say you don't know. Provide citations as [source:index] based on given metadata.";

std::string extractive_answer(const std::vector<std::string>& contexts) {
  std::string out;
  for (size_t i = 0; i < contexts.size() && i < 3; ++i) {
    if (i) out += '\n';
    out += contexts[i];
  }
  out += "\n\n(LLM not configured - returning top context chunks)";
  return out;
}

ChatRequest AnswerGenerator::build_request(const std::string& query,
                                           const std::vector<std::string>& contexts) const {
  std::string block;
  for (size_t i = 0; i < contexts.size(); ++i) {
    if (i) block += "\n\n";
    block += "[chunk " + std::to_string(i) + "] " + contexts[i];
  }
  ChatRequest req;
  req.messages = {
    {"system", SYSTEM_INSTRUCTIONS},
    {"user", "User question: " + query + "\n\nContext snippets:\n" + block +
             "\n\nAnswer in the same language as the question."},
  };
  req.temperature = 0.2f;
  return req;
}

std::string AnswerGenerator::generate(const std::string& query,
                                      const std::vector<std::string>& contexts) const {
  if (model_) {
    try {
      std::string answer = model_->complete(build_request(query, contexts));
      auto a = answer.find_first_not_of(" \t\r\n");
      if (a != std::string::npos) {
        auto b = answer.find_last_not_of(" \t\r\n");
        return answer.substr(a, b - a + 1);
      }
      logger()->warn("chat model returned an empty answer");
    } catch (const std::exception& e) {
      logger()->warn("chat model call failed: {}", e.what());
    }
  }
  return extractive_answer(contexts);
}
