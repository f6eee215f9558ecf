#include "fakes.hpp"
#include "safety_evaluator.hpp"

#include <catch2/catch.hpp>

TEST_CASE("valid reply is accepted", "[evaluator]") {
  FakeChatModel chat(R"({"safety_level": "not safe", "reason": "Shares a password."})");
  SafetyEvaluator ev(&chat);
  auto res = ev.evaluate("my password is hunter2", {"Passwords must never be shared."});
  REQUIRE(res);
  REQUIRE(res.value().level == SafetyLevel::NotSafe);
  REQUIRE(res.value().reason == "Shares a password.");
}

TEST_CASE("request carries the prompt layout and schema", "[evaluator]") {
  FakeChatModel chat(R"({"safety_level": "safe", "reason": "ok"})");
  SafetyEvaluator ev(&chat);
  auto req = ev.build_request("hello", {"rule one", "rule two"});
  REQUIRE(req.messages.size() == 2);
  REQUIRE(req.messages[0].role == "system");
  const auto& user = req.messages[1].content;
  REQUIRE(user.find("--- TEXT TO EVALUATE ---\n'hello'") != std::string::npos);
  REQUIRE(user.find("--- RULES AND GUIDELINES ---") != std::string::npos);
  REQUIRE(user.find("[Context Snippet 1]:\nrule one") != std::string::npos);
  REQUIRE(user.find("[Context Snippet 2]:\nrule two") != std::string::npos);
  REQUIRE(req.temperature == Approx(0.1f));
  REQUIRE(req.schema == safety_evaluation_schema());
  REQUIRE_FALSE(req.grammar.empty());
}

TEST_CASE("reply wrapped in prose is still parsed", "[evaluator]") {
  auto res = parse_safety_evaluation("Sure! {\"reason\": \"has } brace\", \"safety_level\": \"safe\"} done");
  REQUIRE(res);
  REQUIRE(res.value().level == SafetyLevel::Safe);
  REQUIRE(res.value().reason == "has } brace");
}

TEST_CASE("evaluation failures are classified", "[evaluator]") {
  SECTION("no JSON") {
    auto res = parse_safety_evaluation("I think it is fine.");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::MalformedOutput);
  }
  SECTION("broken JSON") {
    auto res = parse_safety_evaluation("{\"safety_level\": safe}");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::MalformedOutput);
  }
  SECTION("unknown level") {
    auto res = parse_safety_evaluation(R"({"safety_level": "maybe", "reason": "?"})");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::SchemaViolation);
  }
  SECTION("missing reason") {
    auto res = parse_safety_evaluation(R"({"safety_level": "safe"})");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::SchemaViolation);
  }
  SECTION("extra keys are ignored") {
    auto res = parse_safety_evaluation(R"({"safety_level": "safe", "reason": "ok", "confidence": 0.9})");
    REQUIRE(res);
  }
  SECTION("upstream error") {
    FakeChatModel chat("");
    auto res = SafetyEvaluator(&chat).evaluate("t", {});
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::Upstream);
  }
  SECTION("no model configured") {
    auto res = SafetyEvaluator(nullptr).evaluate("t", {"c"});
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::Upstream);
  }
}

TEST_CASE("fail-safe verdict is exact", "[evaluator]") {
  auto j = to_json(fail_safe_evaluation());
  REQUIRE(j == nlohmann::json::parse(R"({"safety_level": "not safe", "reason": "GuardianAI system error."})"));
  REQUIRE(failure_kind_name(FailureKind::SchemaViolation) == std::string("schema_violation"));
}

TEST_CASE("Result misuse is a logic error", "[evaluator]") {
  auto ok = EvaluationResult::ok(SafetyEvaluation{SafetyLevel::Safe, "fine"});
  REQUIRE(ok.has_value());
  REQUIRE_THROWS_AS(ok.error(), std::logic_error);
  auto bad = EvaluationResult::fail({FailureKind::Upstream, "down"});
  REQUIRE_THROWS_AS(bad.value(), std::logic_error);
}

static std::string words(int n, const std::string& w) {
  std::string s;
  for (int i = 0; i < n; ++i) s += (i ? " " : "") + w;
  return s;
}

TEST_CASE("fit_contexts keeps order and cuts at a word boundary", "[evaluator]") {
  std::vector<std::string> ctx = {"aaaa bbbb", "cccc dddd eeee", "ffff"};
  REQUIRE(fit_contexts(ctx, 100) == ctx);
  REQUIRE(fit_contexts(ctx, 18) == std::vector<std::string>{"aaaa bbbb", "cccc dddd"});
  REQUIRE(fit_contexts(ctx, 16) == std::vector<std::string>{"aaaa bbbb", "cccc"});
  REQUIRE(fit_contexts(ctx, 9) == std::vector<std::string>{"aaaa bbbb"});
  REQUIRE(fit_contexts(ctx, 3).empty());
  REQUIRE(context_char_budget(400, 256, 0) == 0);
  REQUIRE(context_char_budget(1256, 256, 100) == (1256 - 256 - 200) * 3 - 100);
}

TEST_CASE("context is trimmed to the model's window", "[evaluator]") {
  FakeChatModel chat(R"({"safety_level": "safe", "reason": "ok"})");
  SafetyEvaluator ev(&chat);
  std::vector<std::string> ctx(5, words(800, "policy"));

  SECTION("unbounded model gets every snippet") {
    auto req = ev.build_request("hello", ctx);
    REQUIRE(req.messages[1].content.find("[Context Snippet 5]") != std::string::npos);
  }
  SECTION("bounded model gets a prompt that fits") {
    chat.ctx_tokens = 4096;
    auto req = ev.build_request("hello", ctx);
    const auto& user = req.messages[1].content;
    REQUIRE(user.find("[Context Snippet 1]:\npolicy") != std::string::npos);
    REQUIRE(user.find("[Context Snippet 5]") == std::string::npos);
    size_t prompt_chars = req.messages[0].content.size() + user.size();
    REQUIRE(prompt_chars <= (size_t)(4096 - req.max_tokens) * 3);
  }
}

TEST_CASE("invalid UTF-8 never reaches the request", "[evaluator]") {
  FakeChatModel chat(R"({"safety_level": "safe", "reason": "ok"})");
  SafetyEvaluator ev(&chat);
  auto req = ev.build_request("caf\xe9", {"r\xe8gle"});
  REQUIRE(req.messages[1].content.find("'caf'") != std::string::npos);
  REQUIRE(req.messages[1].content.find("rgle") != std::string::npos);
}
