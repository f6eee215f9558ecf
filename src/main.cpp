#include "answer_generator.hpp"
#include "backends.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "document_loader.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "evaluation_backend.hpp"
#include "filters.hpp"
#include "guard.hpp"
#include "index_manager.hpp"
#include "logging.hpp"
#include "metadata.hpp"
#include "reranker.hpp"
#include "retriever.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

static std::unique_ptr<Embedder> open_embedder(const Args& args, const Config& cfg) {
  return make_embedder(args.embedding_model.empty() ? cfg.embedding_model : args.embedding_model);
}

// A chat model that fails to load leaves the caller without one.
static std::unique_ptr<ChatModel> open_chat_model(const Config& cfg) {
  try {
    return make_chat_model(cfg);
  } catch (const std::exception& e) {
    logger()->error("chat model unavailable: {}", e.what());
    return nullptr;
  }
}

static int cmd_index(const Args& args, const Config& cfg) {
  logger()->info("discovering files in {}", args.data_dir);
  auto chunks = load_folder(args.data_dir);
  logger()->info("built {} chunks from {}", chunks.size(), args.data_dir);
  if (chunks.empty()) throw IngestionError("no text could be extracted from " + args.data_dir);

  auto store = make_vector_store(cfg);
  auto emb = open_embedder(args, cfg);
  IndexManager index(*store);
  size_t n = ingest_chunks(*emb, index, args.collection, chunks);
  std::cout << "Indexed " << n << " chunks into '" << args.collection << "'. Total points: "
            << index.count(args.collection) << "\n";
  return 0;
}

static int cmd_add_document(const Args& args, const Config& cfg) {
  // validated before anything touches the index
  Metadata md = parse_metadata(args.metadata);
  std::string doc_id = doc_id_for(md);
  logger()->info("processing {} as {}", args.filepath, doc_id);
  auto chunks = load_document(args.filepath, doc_id);

  auto store = make_vector_store(cfg);
  auto emb = open_embedder(args, cfg);
  IndexManager index(*store);
  size_t n = ingest_chunks(*emb, index, args.collection, chunks, md);
  std::cout << "Indexed " << n << " chunks into '" << args.collection << "' (doc_id " << doc_id
            << "). Total points: " << index.count(args.collection) << "\n";
  return 0;
}

static int cmd_query(const Args& args, const Config& cfg) {
  auto store = make_vector_store(cfg);
  auto emb = open_embedder(args, cfg);
  Retriever retriever(*emb, *store);
  logger()->info("searching in collection '{}'", args.collection);

  auto hits = retriever.search(args.collection, args.query, args.top_k);
  Filter filter{args.filters, args.regex};
  if (!filter.empty()) hits = apply_filters(hits, filter);
  if (args.rerank) {
    Reranker reranker = make_reranker(cfg.rerank_model);
    if (!reranker.available()) logger()->warn("--rerank requested but no reranker model is configured");
    hits = reranker.rerank(args.query, std::move(hits));
  }

  std::vector<std::string> contexts;
  for (size_t i = 0; i < hits.size() && (int)i < args.max_ctx; ++i) {
    const auto& p = hits[i].payload;
    contexts.push_back(p.text + "\n[source: " + p.source + "#" + std::to_string(p.chunk_index) + "]\n");
  }

  auto chat = open_chat_model(cfg);
  AnswerGenerator generator(chat.get());
  std::cout << "\n=== Answer ===\n\n" << generator.generate(args.query, contexts) << "\n";

  if (args.show_context) {
    std::cout << "\n=== Top Contexts ===\n\n";
    for (size_t i = 0; i < hits.size(); ++i) {
      const auto& p = hits[i].payload;
      std::cout << "#" << i + 1 << " score=" << std::fixed << std::setprecision(4) << hits[i].score
                << " src=" << p.source << "#" << p.chunk_index << "\n"
                << p.text.substr(0, 500) << " \n\n";
    }
  }
  return 0;
}

// Opens the stores and models per call, so that a setup failure becomes a
// Retrieval failure instead of an exception.
class CommandBackend : public EvaluationBackend {
public:
  CommandBackend(const Args& args, const Config& cfg) : args_(args), cfg_(cfg) {}

  ReportResult evaluate(const std::string& text) override {
    std::unique_ptr<VectorStore> store;
    std::unique_ptr<Embedder> emb;
    try {
      store = make_vector_store(cfg_);
      emb = open_embedder(args_, cfg_);
    } catch (const std::exception& e) {
      return ReportResult::fail({FailureKind::Retrieval, e.what()});
    }
    auto chat = open_chat_model(cfg_);
    Reranker reranker = args_.rerank ? make_reranker(cfg_.rerank_model) : Reranker();

    Retriever retriever(*emb, *store);
    SafetyEvaluator evaluator(chat.get());
    EvaluationOptions opts;
    opts.collection = args_.collection;
    opts.top_k = args_.top_k;
    opts.max_ctx = args_.max_ctx;
    opts.rerank = args_.rerank;
    InProcessBackend backend(retriever, reranker, evaluator, opts);
    return backend.evaluate(text);
  }

private:
  const Args& args_;
  const Config& cfg_;
};

static int cmd_evaluate(const Args& args, const Config& cfg) {
  logger()->info("evaluating text against collection '{}'", args.collection);
  CommandBackend backend(args, cfg);
  ReportResult res = backend.evaluate(args.text);
  // the report on success; exactly the fail-safe verdict otherwise
  nlohmann::json out = res ? to_json(res.value()) : to_json(resolve_verdict(res).evaluation);
  std::cout << "\n=== GuardianAI Evaluation ===\n\n" << out.dump(2) << "\n";
  return 0;
}

static int cmd_delete_document(const Args& args, const Config& cfg) {
  auto store = make_vector_store(cfg);
  IndexManager index(*store);
  size_t removed = index.delete_by_doc_id(args.collection, args.doc_id);
  std::cout << "Deleted " << removed << " points with doc_id " << args.doc_id << " from '"
            << args.collection << "'. Total points: " << index.count(args.collection) << "\n";
  return 0;
}

static int cmd_count(const Args& args, const Config& cfg) {
  auto store = make_vector_store(cfg);
  std::cout << store->count(args.collection) << "\n";
  return 0;
}

// With --backend subprocess the evaluation runs in a child `guardrag evaluate`.
static int cmd_guard(const Args& args, const Config& cfg) {
  auto primary = open_chat_model(cfg);

  std::unique_ptr<EvaluationBackend> backend;
  if (args.backend == "subprocess") {
    std::vector<std::string> cmd = {"/proc/self/exe", "evaluate", "--collection", args.collection,
                                    "--top_k", std::to_string(args.top_k),
                                    "--max_ctx", std::to_string(args.max_ctx)};
    if (args.rerank) cmd.push_back("--rerank");
    if (!args.embedding_model.empty()) {
      cmd.push_back("--embedding_model");
      cmd.push_back(args.embedding_model);
    }
    backend = std::make_unique<SubprocessBackend>(cmd, std::max(cfg.timeout_ms * 4, 120000L));
  } else {
    backend = std::make_unique<CommandBackend>(args, cfg);
  }

  Guard guard(*backend, primary.get());
  logger()->info("asking primary assistant");
  GuardedResponse r = guard.respond(args.prompt);
  std::cout << to_json(r).dump(2) << "\n";

  if (r.verdict.allowed()) {
    std::cerr << "Decision: SAFE, response shown to the user.\n";
  } else {
    std::cerr << "Decision: NOT SAFE, response blocked. Reason: " << r.verdict.evaluation.reason << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  load_dotenv();
  Args args;
  Config cfg;
  try {
    args = parse_cli(argc, argv);
    cfg = load_config(process_env());
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n\n" << usage();
    return 1;
  }
  set_log_level(cfg.log_level);

  try {
    if (args.mode == "index") return cmd_index(args, cfg);
    if (args.mode == "add-document") return cmd_add_document(args, cfg);
    if (args.mode == "query") return cmd_query(args, cfg);
    if (args.mode == "evaluate") return cmd_evaluate(args, cfg);
    if (args.mode == "delete-document") return cmd_delete_document(args, cfg);
    if (args.mode == "count") return cmd_count(args, cfg);
    if (args.mode == "guard") return cmd_guard(args, cfg);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  std::cerr << usage();
  return 1;
}
