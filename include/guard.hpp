#pragma once
#include "chat_model.hpp"
#include "evaluation_backend.hpp"
#include <nlohmann/json.hpp>
#include <string>

// What the guard hands to its caller: always a verdict.
struct Verdict {
  SafetyEvaluation evaluation;
  bool degraded = false;   // evaluated without any policy context
  bool fail_safe = false;  // evaluation failed; evaluation is fail_safe_evaluation()
  std::string failure;     // "<kind>: <detail>" when fail_safe

  bool allowed() const { return !fail_safe && evaluation.level == SafetyLevel::Safe; }
};

// The fail-closed policy: any failure becomes the conservative verdict.
Verdict resolve_verdict(const ReportResult& result);

struct GuardedResponse {
  std::string llm_response;
  Verdict verdict;
};

// {"llm_response": ..., "guardian_evaluation": {"safety_level", "reason"}}
nlohmann::json to_json(const GuardedResponse& r);

class Guard {
public:
  // primary may be null; the assistant then answers with a fixed apology.
  Guard(EvaluationBackend& backend, ChatModel* primary) : backend_(backend), primary_(primary) {}

  Verdict check(const std::string& text);

  // Ask the primary assistant, then check its answer.
  GuardedResponse respond(const std::string& prompt);

  std::string primary_response(const std::string& prompt);

private:
  EvaluationBackend& backend_;
  ChatModel* primary_;
};
