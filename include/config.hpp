#pragma once
#include <istream>
#include <map>
#include <string>

struct Config {
  std::string qdrant_url;                 // empty -> local store
  std::string qdrant_api_key;
  std::string index_dir = "./index";
  std::string embedding_model = "hash";   // GGUF path or "hash"
  std::string rerank_model;
  std::string groq_api_key;
  std::string groq_model = "meta-llama/llama-4-maverick-17b-128e-instruct";
  std::string groq_base_url = "https://api.groq.com/openai/v1";
  std::string chat_model;                 // local GGUF, used without a Groq key
  int chat_ctx = 0;                       // local context window, 0 = from the model
  long timeout_ms = 30000;
  std::string log_level = "info";
};

using EnvMap = std::map<std::string, std::string>;

// Defaults overridden by whatever keys env carries.
Config load_config(const EnvMap& env);

// The process environment, restricted to the keys load_config reads.
EnvMap process_env();

// KEY=VALUE lines; blank lines, '#' comments and an "export " prefix are
// accepted, matching single or double quotes around the value are dropped.
EnvMap parse_dotenv(std::istream& in);

// Set variables from a .env file that are not already in the environment.
// A missing file is not an error.
void load_dotenv(const std::string& path = ".env");
