#include "fakes.hpp"
#include "reranker.hpp"

#include <catch2/catch.hpp>

static std::vector<ScoredCandidate> candidates() {
  std::vector<ScoredCandidate> out;
  for (auto* t : {"first", "second", "third"}) {
    ScoredCandidate c;
    c.payload.text = t;
    c.score = 1.0f - 0.1f * (float)out.size();
    out.push_back(c);
  }
  return out;
}

TEST_CASE("reranker without a model is the identity", "[reranker]") {
  Reranker r;
  REQUIRE_FALSE(r.available());
  auto out = r.rerank("q", candidates());
  REQUIRE(out.size() == 3);
  REQUIRE(out[0].payload.text == "first");
  REQUIRE(out[0].score == Approx(1.0f));
  REQUIRE(out[2].payload.text == "third");
}

TEST_CASE("reranker reorders by cross-encoder score", "[reranker]") {
  Reranker r(std::make_unique<FakeCrossEncoder>(std::map<std::string, float>{
      {"first", 0.1f}, {"second", 0.9f}, {"third", 0.5f}}));
  REQUIRE(r.available());
  auto out = r.rerank("q", candidates());
  REQUIRE(out[0].payload.text == "second");
  REQUIRE(out[0].score == Approx(0.9f));
  REQUIRE(out[1].payload.text == "third");
  REQUIRE(out[2].payload.text == "first");
}

TEST_CASE("reranker keeps input order on ties", "[reranker]") {
  Reranker r(std::make_unique<FakeCrossEncoder>(std::map<std::string, float>{}));
  auto out = r.rerank("q", candidates());
  REQUIRE(out[0].payload.text == "first");
  REQUIRE(out[1].payload.text == "second");
  REQUIRE(out[2].payload.text == "third");
}

TEST_CASE("make_reranker without a path is unavailable", "[reranker]") {
  REQUIRE_FALSE(make_reranker("").available());
}
