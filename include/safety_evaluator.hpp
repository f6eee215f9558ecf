#pragma once
#include "chat_model.hpp"
#include "result.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class SafetyLevel { Safe, NotSafe };

// Wire names "safe" / "not safe".
std::string to_string(SafetyLevel level);

struct SafetyEvaluation {
  SafetyLevel level = SafetyLevel::NotSafe;
  std::string reason;
};

bool operator==(const SafetyEvaluation& a, const SafetyEvaluation& b);

// {"safety_level": ..., "reason": ...}
nlohmann::json to_json(const SafetyEvaluation& e);

// The conservative verdict every evaluation failure resolves to.
SafetyEvaluation fail_safe_evaluation();

enum class FailureKind {
  Retrieval,        // embedding or index failure while gathering context
  Upstream,         // chat call failed or timed out, or no model configured
  MalformedOutput,  // reply holds no parsable JSON object
  SchemaViolation,  // JSON object of the wrong shape
  Subprocess,       // out-of-process run failed
};

const char* failure_kind_name(FailureKind kind);

struct EvaluationFailure {
  FailureKind kind;
  std::string detail;
};

using EvaluationResult = Result<SafetyEvaluation, EvaluationFailure>;

const nlohmann::json& safety_evaluation_schema();
const std::string& safety_evaluation_grammar();

// Strict shape check: safety_level one of the two names, reason a string.
// Extra keys are ignored.
EvaluationResult validate_safety_evaluation(const nlohmann::json& j);

// First JSON object found in raw model output, then validated.
EvaluationResult parse_safety_evaluation(const std::string& raw);

// Balanced-brace scan from the first '{'; empty when there is none.
std::string extract_first_json_object(const std::string& text);

// Snippets in order until max_chars is used up; the one that overflows is cut
// at a word boundary and the rest are dropped.
std::vector<std::string> fit_contexts(const std::vector<std::string>& contexts, size_t max_chars);

// Characters left for context snippets in a window of context_tokens once the
// reply, the prompt scaffolding and fixed_chars of other text are paid for.
size_t context_char_budget(int context_tokens, int max_tokens, size_t fixed_chars);

// Structured verdict over given context snippets. Never throws for model
// failures: they come back as EvaluationFailure and the caller decides.
class SafetyEvaluator {
public:
  // model may be null: every evaluation then fails with Upstream.
  explicit SafetyEvaluator(ChatModel* model) : model_(model) {}

  // Invalid UTF-8 is dropped from text and contexts. For a model with a
  // bounded window the contexts are trimmed to fit it.
  ChatRequest build_request(const std::string& text, const std::vector<std::string>& contexts) const;
  EvaluationResult evaluate(const std::string& text, const std::vector<std::string>& contexts) const;

private:
  ChatModel* model_;
};
