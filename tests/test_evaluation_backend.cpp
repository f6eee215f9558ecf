#include "chunker.hpp"
#include "evaluation_backend.hpp"
#include "fakes.hpp"
#include "index_manager.hpp"
#include "local_vector_store.hpp"

#include <catch2/catch.hpp>
#include <chrono>
#include <map>
#include <memory>

static const char* SAFE_REPLY = R"({"safety_level": "safe", "reason": "No rule is violated."})";

TEST_CASE("in-process backend over an empty collection is degraded, not an error", "[backend]") {
  TempDir dir;
  LocalVectorStore store(dir.str());
  LetterEmbedder emb;
  FakeChatModel chat(SAFE_REPLY);
  Retriever retriever(emb, store);
  Reranker reranker;
  SafetyEvaluator evaluator(&chat);
  EvaluationOptions opts;
  opts.collection = "empty";
  InProcessBackend backend(retriever, reranker, evaluator, opts);

  auto res = backend.evaluate("hello there");
  REQUIRE(res);
  REQUIRE(res.value().degraded);
  REQUIRE(res.value().context_count == 0);
  REQUIRE(res.value().evaluation.level == SafetyLevel::Safe);
  REQUIRE(to_json(res.value())["degraded"] == true);
}

TEST_CASE("in-process backend passes at most max_ctx snippets", "[backend]") {
  TempDir dir;
  LocalVectorStore store(dir.str());
  IndexManager index(store);
  LetterEmbedder emb;
  ingest_chunks(emb, index, "rules", chunk_document("a b c d e f g h i j", "d", "d.txt", 2, 0));

  FakeChatModel chat(SAFE_REPLY);
  Retriever retriever(emb, store);
  Reranker reranker;
  SafetyEvaluator evaluator(&chat);
  EvaluationOptions opts;
  opts.collection = "rules";
  opts.top_k = 5;
  opts.max_ctx = 2;
  InProcessBackend backend(retriever, reranker, evaluator, opts);

  REQUIRE(backend.gather_context("a b").size() == 2);
  auto res = backend.evaluate("a b");
  REQUIRE(res);
  REQUIRE_FALSE(res.value().degraded);
  REQUIRE(res.value().context_count == 2);
  REQUIRE(chat.last.messages[1].content.find("[Context Snippet 2]") != std::string::npos);
  REQUIRE(chat.last.messages[1].content.find("[Context Snippet 3]") == std::string::npos);
  REQUIRE_FALSE(to_json(res.value()).contains("degraded"));
}

TEST_CASE("reranking happens before the max_ctx cut", "[backend]") {
  TempDir dir;
  LocalVectorStore store(dir.str());
  IndexManager index(store);
  LetterEmbedder emb;
  ingest_chunks(emb, index, "rules", chunk_document("a b c d e f g h i j", "d", "d.txt", 2, 0));

  FakeChatModel chat(SAFE_REPLY);
  Retriever retriever(emb, store);
  Reranker reranker(std::make_unique<FakeCrossEncoder>(std::map<std::string, float>{{"i j", 5.0f}}));
  SafetyEvaluator evaluator(&chat);
  EvaluationOptions opts;
  opts.collection = "rules";
  opts.top_k = 5;
  opts.max_ctx = 1;

  SECTION("without rerank the nearest chunk is kept") {
    InProcessBackend backend(retriever, reranker, evaluator, opts);
    REQUIRE(backend.gather_context("a b") == std::vector<std::string>{"a b"});
  }
  SECTION("with rerank the promoted chunk reaches the evaluator") {
    opts.rerank = true;
    InProcessBackend backend(retriever, reranker, evaluator, opts);
    auto res = backend.evaluate("a b");
    REQUIRE(res);
    REQUIRE(res.value().context_count == 1);
    const auto& prompt = chat.last.messages[1].content;
    REQUIRE(prompt.find("[Context Snippet 1]:\ni j") != std::string::npos);
    REQUIRE(prompt.find("[Context Snippet 2]") == std::string::npos);
  }
}

TEST_CASE("retrieval failure is reported, not thrown", "[backend]") {
  TempDir dir;
  LocalVectorStore store(dir.str());
  FailingEmbedder emb;
  FakeChatModel chat(SAFE_REPLY);
  Retriever retriever(emb, store);
  Reranker reranker;
  SafetyEvaluator evaluator(&chat);
  EvaluationOptions opts;
  opts.collection = "c";
  InProcessBackend backend(retriever, reranker, evaluator, opts);

  auto res = backend.evaluate("text");
  REQUIRE_FALSE(res);
  REQUIRE(res.error().kind == FailureKind::Retrieval);
  REQUIRE(chat.calls == 0);
}

TEST_CASE("parse_evaluation_output reads the evaluate block", "[backend]") {
  auto res = parse_evaluation_output(
      "\n=== GuardianAI Evaluation ===\n\n"
      "{\n  \"context_count\": 0,\n  \"degraded\": true,\n"
      "  \"reason\": \"No rules found.\",\n  \"safety_level\": \"safe\"\n}\n");
  REQUIRE(res);
  REQUIRE(res.value().degraded);
  REQUIRE(res.value().evaluation.reason == "No rules found.");

  auto bad = parse_evaluation_output("Traceback: something broke");
  REQUIRE_FALSE(bad);
  REQUIRE(bad.error().kind == FailureKind::Subprocess);

  auto wrong = parse_evaluation_output(R"({"verdict": "ok"})");
  REQUIRE_FALSE(wrong);
  REQUIRE(wrong.error().kind == FailureKind::Subprocess);
}

TEST_CASE("subprocess backend", "[backend]") {
  SECTION("non-zero exit fails") {
    SubprocessBackend backend({"false"}, 5000);
    auto res = backend.evaluate("text");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::Subprocess);
  }
  SECTION("stdout is parsed") {
    SubprocessBackend backend({"echo", R"({"safety_level": "not safe", "reason": "blocked"})"}, 5000);
    auto res = backend.evaluate("text");
    REQUIRE(res);
    REQUIRE(res.value().evaluation.level == SafetyLevel::NotSafe);
    REQUIRE(res.value().evaluation.reason == "blocked");
  }
  SECTION("timeout kills the child") {
    SubprocessBackend backend({"sh", "-c", "sleep 10", "sh"}, 200);
    auto res = backend.evaluate("text");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().detail.find("timed out") != std::string::npos);
  }
  SECTION("child that closes stdout and hangs is still killed at the deadline") {
    auto start = std::chrono::steady_clock::now();
    auto po = run_process({"sh", "-c", "exec >&-; sleep 10"}, 300);
    auto took = std::chrono::steady_clock::now() - start;
    REQUIRE(po.timed_out);
    REQUIRE(po.exit_code == -1);
    REQUIRE(took < std::chrono::seconds(5));
  }
  SECTION("missing executable fails") {
    SubprocessBackend backend({"/nonexistent/guardrag"}, 1000);
    auto res = backend.evaluate("text");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().kind == FailureKind::Subprocess);
  }
}
