#include "answer_generator.hpp"
#include "fakes.hpp"

#include <catch2/catch.hpp>

TEST_CASE("without a model the answer is extractive", "[answer]") {
  AnswerGenerator gen(nullptr);
  auto answer = gen.generate("q", {"one", "two", "three", "four"});
  REQUIRE(answer == "one\ntwo\nthree\n\n(LLM not configured - returning top context chunks)");
}

TEST_CASE("model answer is trimmed", "[answer]") {
  FakeChatModel chat("  The policy allows 20 days. \n");
  AnswerGenerator gen(&chat);
  REQUIRE(gen.generate("how much leave?", {"20 days"}) == "The policy allows 20 days.");
  REQUIRE(chat.calls == 1);
  REQUIRE(chat.last.messages.size() == 2);
  REQUIRE(chat.last.messages[1].content.find("[chunk 0] 20 days") != std::string::npos);
  REQUIRE(chat.last.schema.is_null());
}

TEST_CASE("failing model falls back to context", "[answer]") {
  FakeChatModel chat("");
  AnswerGenerator gen(&chat);
  auto answer = gen.generate("q", {"only"});
  REQUIRE(answer.rfind("only\n\n(LLM not configured", 0) == 0);
}
