#include "cli.hpp"

#include <catch2/catch.hpp>
#include <string>
#include <vector>

static Args parse(std::vector<std::string> args) {
  std::vector<char*> argv;
  static std::string prog = "guardrag";
  argv.push_back(&prog[0]);
  for (auto& a : args) argv.push_back(&a[0]);
  return parse_cli((int)argv.size(), argv.data());
}

TEST_CASE("query flags and defaults", "[cli]") {
  auto a = parse({"query", "--collection", "pol", "-q", "vacation days", "--rerank",
                  "--filter", "leave", "--filter", "hr", "--regex", "\\d+"});
  REQUIRE(a.mode == "query");
  REQUIRE(a.collection == "pol");
  REQUIRE(a.query == "vacation days");
  REQUIRE(a.top_k == 8);
  REQUIRE(a.max_ctx == 4);
  REQUIRE(a.rerank);
  REQUIRE_FALSE(a.show_context);
  REQUIRE(a.filters == std::vector<std::string>{"leave", "hr"});
  REQUIRE(a.regex == std::vector<std::string>{"\\d+"});
}

TEST_CASE("evaluate has its own defaults", "[cli]") {
  auto a = parse({"evaluate", "--collection", "pol", "--text", "hi"});
  REQUIRE(a.top_k == 5);
  REQUIRE(a.max_ctx == 5);

  a = parse({"evaluate", "--collection", "pol", "--text", "hi", "--top_k", "3", "--max_ctx", "2"});
  REQUIRE(a.top_k == 3);
  REQUIRE(a.max_ctx == 2);
}

TEST_CASE("ingestion and admin commands", "[cli]") {
  auto a = parse({"add-document", "--collection", "c", "--filepath", "p.pdf", "--metadata", "{\"id\":\"P1\"}"});
  REQUIRE(a.filepath == "p.pdf");
  REQUIRE(a.metadata == "{\"id\":\"P1\"}");

  a = parse({"delete-document", "--collection", "c", "--doc_id", "P1"});
  REQUIRE(a.doc_id == "P1");

  a = parse({"guard", "--collection", "c", "--prompt", "hello", "--backend", "subprocess"});
  REQUIRE(a.backend == "subprocess");
}

TEST_CASE("usage errors", "[cli]") {
  REQUIRE_THROWS_AS(parse({}), std::invalid_argument);
  REQUIRE_THROWS_AS(parse({"serve"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parse({"query", "--collection", "c"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parse({"index", "--data_dir", "d"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parse({"query", "--collection", "c", "-q", "x", "--top_k", "zero"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parse({"query", "--collection", "c", "-q", "x", "--top_k", "0"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parse({"query", "--collection", "c", "-q"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parse({"count", "--collection", "c", "--verbose"}), std::invalid_argument);
  REQUIRE_THROWS_AS(parse({"guard", "--collection", "c", "--prompt", "p", "--backend", "thread"}),
                    std::invalid_argument);
}
