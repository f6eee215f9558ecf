#include "evaluation_backend.hpp"
#include "logging.hpp"
#include <algorithm>

using json = nlohmann::json;

json to_json(const EvaluationReport& r) {
  json j = to_json(r.evaluation);
  j["context_count"] = r.context_count;
  if (r.degraded) j["degraded"] = true;
  return j;
}

InProcessBackend::InProcessBackend(Retriever& retriever, const Reranker& reranker,
                                   const SafetyEvaluator& evaluator, EvaluationOptions opts)
  : retriever_(retriever), reranker_(reranker), evaluator_(evaluator), opts_(std::move(opts)) {}

std::vector<std::string> InProcessBackend::gather_context(const std::string& text) {
  auto hits = retriever_.search(opts_.collection, text, opts_.top_k);
  if (opts_.rerank) {
    if (!reranker_.available()) logger()->warn("--rerank requested but no reranker model is configured");
    hits = reranker_.rerank(text, std::move(hits));
  }
  std::vector<std::string> contexts;
  for (size_t i = 0; i < hits.size() && (int)i < opts_.max_ctx; ++i)
    contexts.push_back(hits[i].payload.text);
  return contexts;
}

ReportResult InProcessBackend::evaluate(const std::string& text) {
  std::vector<std::string> contexts;
  try {
    contexts = gather_context(text);
  } catch (const std::exception& e) {
    return ReportResult::fail({FailureKind::Retrieval, e.what()});
  }

  EvaluationReport report;
  report.context_count = contexts.size();
  report.degraded = contexts.empty();
  if (report.degraded) {
    logger()->warn("no relevant context found in '{}'; evaluation may be unreliable", opts_.collection);
  }

  auto res = evaluator_.evaluate(text, contexts);
  if (!res) return ReportResult::fail(res.error());
  report.evaluation = res.value();
  return ReportResult::ok(std::move(report));
}

SubprocessBackend::SubprocessBackend(std::vector<std::string> command, long timeout_ms)
  : command_(std::move(command)), timeout_ms_(timeout_ms) {}

ReportResult SubprocessBackend::evaluate(const std::string& text) {
  std::vector<std::string> argv = command_;
  argv.push_back("--text");
  argv.push_back(text);

  ProcessOutput po;
  try {
    po = run_process(argv, timeout_ms_);
  } catch (const std::exception& e) {
    return ReportResult::fail({FailureKind::Subprocess, e.what()});
  }
  if (po.timed_out)
    return ReportResult::fail({FailureKind::Subprocess, "timed out after " + std::to_string(timeout_ms_) + " ms"});
  if (po.exit_code != 0)
    return ReportResult::fail({FailureKind::Subprocess, "exit status " + std::to_string(po.exit_code)});
  return parse_evaluation_output(po.out);
}

ReportResult parse_evaluation_output(const std::string& out) {
  std::string obj = extract_first_json_object(out);
  if (obj.empty())
    return ReportResult::fail({FailureKind::Subprocess, "no JSON in evaluator output"});
  auto j = json::parse(obj, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded())
    return ReportResult::fail({FailureKind::Subprocess, "unparsable evaluator output"});

  auto res = validate_safety_evaluation(j);
  if (!res) return ReportResult::fail({FailureKind::Subprocess, res.error().detail});

  EvaluationReport report;
  report.evaluation = res.value();
  auto d = j.find("degraded");
  report.degraded = d != j.end() && d->is_boolean() && d->get<bool>();
  auto n = j.find("context_count");
  if (n != j.end() && n->is_number_unsigned()) report.context_count = n->get<size_t>();
  return ReportResult::ok(std::move(report));
}
