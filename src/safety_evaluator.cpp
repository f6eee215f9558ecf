// src/safety_evaluator.cpp
#include "safety_evaluator.hpp"
#include "logging.hpp"
#include "utf8.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

static const char* SYSTEM_INSTRUCTIONS =
"You are the GuardianAI. Your task is to evaluate a given text based on a set of rules and guidelines "
"provided as context. Determine if the text is 'safe' or 'not safe'.\n"
"- 'safe' means the text does not violate any of the rules.\n"
"- 'not safe' means the text violates one or more rules.\n"
"Provide a clear reason for your decision based *only* on the given context snippets.";

static const char* FAIL_SAFE_REASON = "GuardianAI system error.";

// Token budget arithmetic for models with a bounded window. Characters per
// token is kept low so non-English policy text still fits.
static const int CHARS_PER_TOKEN = 3;
static const int PROMPT_OVERHEAD_TOKENS = 200;

std::string to_string(SafetyLevel level) {
  return level == SafetyLevel::Safe ? "safe" : "not safe";
}

bool operator==(const SafetyEvaluation& a, const SafetyEvaluation& b) {
  return a.level == b.level && a.reason == b.reason;
}

json to_json(const SafetyEvaluation& e) {
  return json{{"safety_level", to_string(e.level)}, {"reason", e.reason}};
}

SafetyEvaluation fail_safe_evaluation() {
  return SafetyEvaluation{SafetyLevel::NotSafe, FAIL_SAFE_REASON};
}

const char* failure_kind_name(FailureKind kind) {
  switch (kind) {
    case FailureKind::Retrieval: return "retrieval";
    case FailureKind::Upstream: return "upstream";
    case FailureKind::MalformedOutput: return "malformed_output";
    case FailureKind::SchemaViolation: return "schema_violation";
    case FailureKind::Subprocess: return "subprocess";
  }
  return "unknown";
}

const json& safety_evaluation_schema() {
  static const json schema = json::parse(R"({
    "title": "SafetyEvaluation",
    "type": "object",
    "properties": {
      "safety_level": {
        "type": "string",
        "enum": ["safe", "not safe"],
        "description": "Indicates whether the provided text is considered safe or not safe based on the given context."
      },
      "reason": {
        "type": "string",
        "description": "A brief explanation for the safety evaluation decision."
      }
    },
    "required": ["safety_level", "reason"],
    "additionalProperties": false
  })");
  return schema;
}

const std::string& safety_evaluation_grammar() {
  static const std::string grammar = R"gbnf(
root   ::= "{" ws "\"safety_level\"" ws ":" ws level ws "," ws "\"reason\"" ws ":" ws string ws "}"
level  ::= "\"safe\"" | "\"not safe\""
string ::= "\"" ( [^"\\\x7F\x00-\x1F] | "\\" ( ["\\/bfnrt] | "u" [0-9a-fA-F]{4} ) )* "\""
ws     ::= [ \t\n]{0,16}
)gbnf";
  return grammar;
}

std::string extract_first_json_object(const std::string& text) {
  size_t start = text.find('{');
  if (start == std::string::npos) return "";
  int depth = 0;
  bool in_str = false, esc = false;
  for (size_t i = start; i < text.size(); ++i) {
    char c = text[i];
    if (in_str) {
      if (esc) esc = false;
      else if (c == '\\') esc = true;
      else if (c == '"') in_str = false;
      continue;
    }
    if (c == '"') in_str = true;
    else if (c == '{') depth++;
    else if (c == '}') {
      if (--depth == 0) return text.substr(start, i - start + 1);
    }
  }
  return "";
}

EvaluationResult validate_safety_evaluation(const json& j) {
  auto violation = [](const std::string& what) {
    return EvaluationResult::fail({FailureKind::SchemaViolation, what});
  };
  if (!j.is_object()) return violation("evaluation is not a JSON object");

  auto level = j.find("safety_level");
  if (level == j.end()) return violation("missing safety_level");
  if (!level->is_string()) return violation("safety_level is not a string");
  SafetyEvaluation e;
  const auto& name = level->get_ref<const std::string&>();
  if (name == "safe") e.level = SafetyLevel::Safe;
  else if (name == "not safe") e.level = SafetyLevel::NotSafe;
  else return violation("safety_level '" + name + "' is not one of 'safe', 'not safe'");

  auto reason = j.find("reason");
  if (reason == j.end()) return violation("missing reason");
  if (!reason->is_string()) return violation("reason is not a string");
  e.reason = reason->get<std::string>();
  return EvaluationResult::ok(std::move(e));
}

EvaluationResult parse_safety_evaluation(const std::string& raw) {
  std::string obj = extract_first_json_object(raw);
  if (obj.empty()) return EvaluationResult::fail({FailureKind::MalformedOutput, "no JSON object in model output"});
  auto j = json::parse(obj, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return EvaluationResult::fail({FailureKind::MalformedOutput, "unparsable JSON: " + obj.substr(0, 200)});
  return validate_safety_evaluation(j);
}

std::vector<std::string> fit_contexts(const std::vector<std::string>& contexts, size_t max_chars) {
  std::vector<std::string> out;
  size_t used = 0;
  for (auto& c : contexts) {
    if (used + c.size() <= max_chars) {
      out.push_back(c);
      used += c.size();
      continue;
    }
    size_t room = max_chars - used;
    size_t cut = room > 0 ? c.rfind(' ', room) : std::string::npos;
    if (cut != std::string::npos && cut > 0) out.push_back(c.substr(0, cut));
    break;
  }
  return out;
}

size_t context_char_budget(int context_tokens, int max_tokens, size_t fixed_chars) {
  long tokens = (long)context_tokens - max_tokens - PROMPT_OVERHEAD_TOKENS;
  long chars = tokens * CHARS_PER_TOKEN - (long)fixed_chars;
  return chars > 0 ? (size_t)chars : 0;
}

ChatRequest SafetyEvaluator::build_request(const std::string& raw_text,
                                           const std::vector<std::string>& raw_contexts) const {
  const std::string text = drop_invalid_utf8(raw_text);
  std::vector<std::string> contexts;
  for (auto& c : raw_contexts) contexts.push_back(drop_invalid_utf8(c));

  const int max_tokens = 256;
  if (model_ && model_->context_tokens() > 0) {
    size_t fixed = std::char_traits<char>::length(SYSTEM_INSTRUCTIONS) + text.size();
    size_t budget = context_char_budget(model_->context_tokens(), max_tokens, fixed);
    size_t total = 0;
    for (auto& c : contexts) total += c.size();
    if (total > budget) {
      logger()->warn("policy context trimmed from {} to {} chars to fit a {}-token window",
                     total, budget, model_->context_tokens());
      contexts = fit_contexts(contexts, budget);
    }
  }

  std::string context_block;
  for (size_t i = 0; i < contexts.size(); ++i) {
    if (i) context_block.append("\n\n");
    context_block.append("[Context Snippet " + std::to_string(i + 1) + "]:\n");
    context_block.append(contexts[i]);
  }

  std::string user;
  user.reserve(text.size() + context_block.size() + 256);
  user.append("Please evaluate the following text:\n\n");
  user.append("--- TEXT TO EVALUATE ---\n");
  user.append("'" + text + "'\n\n");
  user.append("--- RULES AND GUIDELINES ---\n");
  user.append(context_block);
  user.append("\n\nBased on these rules, is the text safe or not safe? "
              "Provide your answer in the requested JSON format.");

  ChatRequest req;
  req.messages = {{"system", SYSTEM_INSTRUCTIONS}, {"user", user}};
  req.temperature = 0.1f;
  req.max_tokens = max_tokens;
  req.schema_name = "safety_evaluation";
  req.schema = safety_evaluation_schema();
  req.grammar = safety_evaluation_grammar();
  return req;
}

EvaluationResult SafetyEvaluator::evaluate(const std::string& text,
                                           const std::vector<std::string>& contexts) const {
  if (!model_) return EvaluationResult::fail({FailureKind::Upstream, "no chat model configured"});

  std::string raw;
  try {
    raw = model_->complete(build_request(text, contexts));
  } catch (const std::exception& e) {
    return EvaluationResult::fail({FailureKind::Upstream, e.what()});
  }
  return parse_safety_evaluation(raw);
}
