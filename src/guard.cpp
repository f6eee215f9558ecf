#include "guard.hpp"
#include "logging.hpp"
#include "utf8.hpp"

using json = nlohmann::json;

static const char* PRIMARY_SYSTEM = "You are a helpful assistant in a corporate environment.";
static const char* PRIMARY_UNAVAILABLE = "I am unable to answer this question at the moment.";

Verdict resolve_verdict(const ReportResult& result) {
  Verdict v;
  if (result) {
    v.evaluation = result.value().evaluation;
    v.degraded = result.value().degraded;
    return v;
  }
  const auto& f = result.error();
  logger()->error("evaluation failed ({}): {}", failure_kind_name(f.kind), f.detail);
  v.evaluation = fail_safe_evaluation();
  v.fail_safe = true;
  v.failure = std::string(failure_kind_name(f.kind)) + ": " + f.detail;
  return v;
}

json to_json(const GuardedResponse& r) {
  return json{{"llm_response", r.llm_response}, {"guardian_evaluation", to_json(r.verdict.evaluation)}};
}

Verdict Guard::check(const std::string& text) {
  return resolve_verdict(backend_.evaluate(text));
}

std::string Guard::primary_response(const std::string& prompt) {
  if (!primary_) return PRIMARY_UNAVAILABLE;
  ChatRequest req;
  req.messages = {{"system", PRIMARY_SYSTEM}, {"user", prompt}};
  req.temperature = 0.7f;
  try {
    std::string answer = drop_invalid_utf8(primary_->complete(req));
    auto a = answer.find_first_not_of(" \t\r\n");
    auto b = answer.find_last_not_of(" \t\r\n");
    return a == std::string::npos ? "" : answer.substr(a, b - a + 1);
  } catch (const std::exception& e) {
    logger()->error("primary assistant failed: {}", e.what());
    return PRIMARY_UNAVAILABLE;
  }
}

GuardedResponse Guard::respond(const std::string& prompt) {
  GuardedResponse r;
  r.llm_response = primary_response(prompt);
  r.verdict = check(r.llm_response);
  return r;
}
