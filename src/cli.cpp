#include "cli.hpp"
#include <stdexcept>

static const char* USAGE =
"guardrag index --collection C --data_dir D [--embedding_model M]\n"
"guardrag add-document --collection C --filepath F --metadata JSON [--embedding_model M]\n"
"guardrag query --collection C -q TEXT [--top_k N] [--max_ctx N] [--rerank] [--show_context]\n"
"               [--filter KEYWORD]... [--regex PATTERN]... [--embedding_model M]\n"
"guardrag evaluate --collection C --text TEXT [--top_k N] [--max_ctx N] [--rerank] [--embedding_model M]\n"
"guardrag delete-document --collection C --doc_id ID\n"
"guardrag count --collection C\n"
"guardrag guard --collection C --prompt TEXT [--backend inprocess|subprocess] [--top_k N] [--max_ctx N] [--rerank]\n";

const char* usage() { return USAGE; }

static int to_positive(const std::string& flag, const std::string& v) {
  size_t pos = 0;
  int n = 0;
  try {
    n = std::stoi(v, &pos);
  } catch (const std::exception&) {
    throw std::invalid_argument(flag + " expects a number, got '" + v + "'");
  }
  if (pos != v.size()) throw std::invalid_argument(flag + " expects a number, got '" + v + "'");
  if (n < 1) throw std::invalid_argument(flag + " must be at least 1");
  return n;
}

static void require(const std::string& value, const char* flag, const std::string& mode) {
  if (value.empty()) throw std::invalid_argument(mode + " requires " + flag);
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) throw std::invalid_argument("missing command");
  a.mode = argv[1];
  if (a.mode == "evaluate" || a.mode == "guard") { a.top_k = 5; a.max_ctx = 5; }
  else if (a.mode != "index" && a.mode != "add-document" && a.mode != "query" &&
           a.mode != "delete-document" && a.mode != "count")
    throw std::invalid_argument("unknown command: " + a.mode);

  int i = 2;
  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) throw std::invalid_argument("missing value after " + f);
      dst = argv[i++];
    };
    std::string v;
    if (f == "--collection") next(a.collection);
    else if (f == "--data_dir") next(a.data_dir);
    else if (f == "--filepath") next(a.filepath);
    else if (f == "--metadata") next(a.metadata);
    else if (f == "--embedding_model") next(a.embedding_model);
    else if (f == "-q" || f == "--query") next(a.query);
    else if (f == "--text") next(a.text);
    else if (f == "--doc_id") next(a.doc_id);
    else if (f == "--prompt") next(a.prompt);
    else if (f == "--backend") next(a.backend);
    else if (f == "--top_k") { next(v); a.top_k = to_positive(f, v); }
    else if (f == "--max_ctx") { next(v); a.max_ctx = to_positive(f, v); }
    else if (f == "--rerank") a.rerank = true;
    else if (f == "--show_context") a.show_context = true;
    else if (f == "--filter") { next(v); a.filters.push_back(v); }
    else if (f == "--regex") { next(v); a.regex.push_back(v); }
    else throw std::invalid_argument("unknown flag: " + f);
  }

  require(a.collection, "--collection", a.mode);
  if (a.mode == "index") require(a.data_dir, "--data_dir", a.mode);
  else if (a.mode == "add-document") {
    require(a.filepath, "--filepath", a.mode);
    require(a.metadata, "--metadata", a.mode);
  }
  else if (a.mode == "query") require(a.query, "-q", a.mode);
  else if (a.mode == "evaluate") require(a.text, "--text", a.mode);
  else if (a.mode == "delete-document") require(a.doc_id, "--doc_id", a.mode);
  else if (a.mode == "guard") {
    require(a.prompt, "--prompt", a.mode);
    if (a.backend != "inprocess" && a.backend != "subprocess")
      throw std::invalid_argument("--backend must be inprocess or subprocess");
  }
  return a;
}
