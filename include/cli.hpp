#pragma once
#include <string>
#include <vector>

struct Args {
  std::string mode;          // index | add-document | query | evaluate | delete-document | count | guard
  std::string collection;
  std::string data_dir;
  std::string filepath;
  std::string metadata;      // JSON object text
  std::string embedding_model; // overrides EMBEDDING_MODEL
  std::string query;
  std::string text;
  std::string doc_id;
  std::string prompt;
  std::string backend = "inprocess";
  int top_k = 8;             // evaluate defaults to 5
  int max_ctx = 4;           // evaluate defaults to 5
  bool rerank = false;
  bool show_context = false;
  std::vector<std::string> filters;
  std::vector<std::string> regex;
};

// Throws std::invalid_argument on anything malformed; the message says what.
Args parse_cli(int argc, char** argv);

const char* usage();
