#include "fakes.hpp"
#include "guard.hpp"

#include <catch2/catch.hpp>

// Backend returning a fixed result.
class ScriptedBackend : public EvaluationBackend {
public:
  explicit ScriptedBackend(ReportResult r) : result_(std::move(r)) {}
  ReportResult evaluate(const std::string& text) override {
    seen = text;
    return result_;
  }
  std::string seen;

private:
  ReportResult result_;
};

static const nlohmann::json FAIL_SAFE =
    nlohmann::json::parse(R"({"safety_level": "not safe", "reason": "GuardianAI system error."})");

TEST_CASE("any failure resolves to exactly the fail-safe verdict", "[guard]") {
  for (auto kind : {FailureKind::Retrieval, FailureKind::Upstream, FailureKind::MalformedOutput,
                    FailureKind::SchemaViolation, FailureKind::Subprocess}) {
    Verdict v = resolve_verdict(ReportResult::fail({kind, "induced"}));
    REQUIRE(v.fail_safe);
    REQUIRE_FALSE(v.allowed());
    REQUIRE(to_json(v.evaluation) == FAIL_SAFE);
    REQUIRE(v.failure.find("induced") != std::string::npos);
  }
}

TEST_CASE("malformed model output through the evaluator ends fail-safe", "[guard]") {
  FakeChatModel chat("this is not json");
  SafetyEvaluator evaluator(&chat);
  auto res = evaluator.evaluate("text", {"rule"});
  REQUIRE_FALSE(res);
  Verdict v = resolve_verdict(ReportResult::fail(res.error()));
  REQUIRE(to_json(v.evaluation) == FAIL_SAFE);
}

TEST_CASE("guard checks the primary assistant's answer", "[guard]") {
  EvaluationReport report;
  report.evaluation = SafetyEvaluation{SafetyLevel::Safe, "fine"};
  ScriptedBackend backend(ReportResult::ok(report));
  FakeChatModel primary("  Here is the answer.  ");
  Guard guard(backend, &primary);

  auto r = guard.respond("What is the leave policy?");
  REQUIRE(r.llm_response == "Here is the answer.");
  REQUIRE(backend.seen == "Here is the answer.");
  REQUIRE(r.verdict.allowed());
  REQUIRE(primary.last.messages[0].content == "You are a helpful assistant in a corporate environment.");

  auto j = to_json(r);
  REQUIRE(j["llm_response"] == "Here is the answer.");
  REQUIRE(j["guardian_evaluation"]["safety_level"] == "safe");
}

TEST_CASE("guard without a primary model uses the apology and still evaluates", "[guard]") {
  ScriptedBackend backend(ReportResult::fail({FailureKind::Upstream, "down"}));
  Guard guard(backend, nullptr);
  auto r = guard.respond("hi");
  REQUIRE(r.llm_response == "I am unable to answer this question at the moment.");
  REQUIRE(to_json(r)["guardian_evaluation"] == FAIL_SAFE);
}

TEST_CASE("failing primary model uses the apology", "[guard]") {
  EvaluationReport report;
  report.evaluation = SafetyEvaluation{SafetyLevel::Safe, "fine"};
  ScriptedBackend backend(ReportResult::ok(report));
  FakeChatModel primary("");
  Guard guard(backend, &primary);
  REQUIRE(guard.primary_response("hi") == "I am unable to answer this question at the moment.");
}

TEST_CASE("degraded verdict is carried through", "[guard]") {
  EvaluationReport report;
  report.evaluation = SafetyEvaluation{SafetyLevel::NotSafe, "violates rule 3"};
  report.degraded = true;
  ScriptedBackend backend(ReportResult::ok(report));
  Guard guard(backend, nullptr);
  Verdict v = guard.check("text");
  REQUIRE(v.degraded);
  REQUIRE_FALSE(v.fail_safe);
  REQUIRE_FALSE(v.allowed());
}

TEST_CASE("answer cut mid-character still serializes", "[guard]") {
  EvaluationReport report;
  report.evaluation = SafetyEvaluation{SafetyLevel::Safe, "fine"};
  ScriptedBackend backend(ReportResult::ok(report));
  FakeChatModel primary("It costs 5 \xe2\x82");
  Guard guard(backend, &primary);

  auto r = guard.respond("How much?");
  REQUIRE(r.llm_response == "It costs 5");
  REQUIRE_NOTHROW(to_json(r).dump(2));
}
