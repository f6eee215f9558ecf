#pragma once
#include "reranker.hpp"
#include "result.hpp"
#include "retriever.hpp"
#include "safety_evaluator.hpp"
#include <string>
#include <vector>

struct EvaluationOptions {
  std::string collection;
  int top_k = 5;
  int max_ctx = 5;
  bool rerank = false;
};

struct EvaluationReport {
  SafetyEvaluation evaluation;
  size_t context_count = 0;
  // No policy context was found: the verdict has no grounding.
  bool degraded = false;
};

using ReportResult = Result<EvaluationReport, EvaluationFailure>;

// {"safety_level", "reason", "context_count"} plus "degraded": true when
// retrieval found nothing.
nlohmann::json to_json(const EvaluationReport& r);

// Retrieve policy context for a text and evaluate it. Implementations never
// throw; every failure comes back as EvaluationFailure.
class EvaluationBackend {
public:
  virtual ~EvaluationBackend() = default;
  virtual ReportResult evaluate(const std::string& text) = 0;
};

// Retriever -> (Reranker) -> SafetyEvaluator on the calling thread.
class InProcessBackend : public EvaluationBackend {
public:
  InProcessBackend(Retriever& retriever, const Reranker& reranker,
                   const SafetyEvaluator& evaluator, EvaluationOptions opts);

  ReportResult evaluate(const std::string& text) override;

  // Context texts for text: top_k hits, optionally reranked, first max_ctx.
  std::vector<std::string> gather_context(const std::string& text);

private:
  Retriever& retriever_;
  const Reranker& reranker_;
  const SafetyEvaluator& evaluator_;
  EvaluationOptions opts_;
};

// Runs `<command...> --text <text>` as a child process and parses the first
// JSON object on its stdout. A non-zero exit, a timeout or unparsable output is a
// Subprocess failure. The child is killed when the timeout expires.
class SubprocessBackend : public EvaluationBackend {
public:
  SubprocessBackend(std::vector<std::string> command, long timeout_ms=120000);

  ReportResult evaluate(const std::string& text) override;

private:
  std::vector<std::string> command_;
  long timeout_ms_;
};

// stdout of an `evaluate` run -> report. Output that is not a valid
// evaluation is a Subprocess failure.
ReportResult parse_evaluation_output(const std::string& out);

struct ProcessOutput {
  int exit_code = -1;     // -1 when killed by a signal
  bool timed_out = false;
  std::string out;
};

// Spawn argv[0] (PATH lookup), capture stdout, wait at most timeout_ms.
// Throws std::runtime_error when the process cannot be started.
ProcessOutput run_process(const std::vector<std::string>& argv, long timeout_ms);
