#include "config.hpp"

#include <catch2/catch.hpp>
#include <sstream>

TEST_CASE("config defaults", "[config]") {
  Config c = load_config({});
  REQUIRE(c.qdrant_url.empty());
  REQUIRE(c.index_dir == "./index");
  REQUIRE(c.embedding_model == "hash");
  REQUIRE(c.groq_model == "meta-llama/llama-4-maverick-17b-128e-instruct");
  REQUIRE(c.groq_base_url == "https://api.groq.com/openai/v1");
  REQUIRE(c.timeout_ms == 30000);
}

TEST_CASE("config reads the environment map", "[config]") {
  Config c = load_config({{"QDRANT_URL", "http://localhost:6333"}, {"GROQ_API_KEY", "k"},
                          {"GUARDRAG_TIMEOUT_MS", "1500"}, {"EMBEDDING_MODEL", ""}});
  REQUIRE(c.qdrant_url == "http://localhost:6333");
  REQUIRE(c.groq_api_key == "k");
  REQUIRE(c.timeout_ms == 1500);
  // empty values keep the default
  REQUIRE(c.embedding_model == "hash");

  REQUIRE_THROWS_AS(load_config({{"GUARDRAG_TIMEOUT_MS", "soon"}}), std::invalid_argument);
  REQUIRE_THROWS_AS(load_config({{"GUARDRAG_TIMEOUT_MS", "-5"}}), std::invalid_argument);
}

TEST_CASE("local chat context size", "[config]") {
  REQUIRE(load_config({}).chat_ctx == 0);
  REQUIRE(load_config({{"GUARDRAG_CHAT_CTX", "16384"}}).chat_ctx == 16384);
  REQUIRE_THROWS_AS(load_config({{"GUARDRAG_CHAT_CTX", "big"}}), std::invalid_argument);
  REQUIRE_THROWS_AS(load_config({{"GUARDRAG_CHAT_CTX", "-1"}}), std::invalid_argument);
}

TEST_CASE("parse_dotenv", "[config]") {
  std::istringstream in(
      "# comment\n"
      "\n"
      "GROQ_API_KEY=abc123\n"
      "export QDRANT_URL = \"http://q:6333\"\n"
      "GROQ_MODEL='llama'\n"
      "not a pair\n");
  auto env = parse_dotenv(in);
  REQUIRE(env.size() == 3);
  REQUIRE(env.at("GROQ_API_KEY") == "abc123");
  REQUIRE(env.at("QDRANT_URL") == "http://q:6333");
  REQUIRE(env.at("GROQ_MODEL") == "llama");
}
