#pragma once
#include "chat_model.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "reranker.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

// 26 dimensions, one per letter, L2-normalized letter counts. Texts that
// share no letters are orthogonal.
class LetterEmbedder : public Embedder {
public:
  EmbeddingBatch embed(const std::vector<std::string>& texts) override {
    if (texts.empty()) throw EmbeddingError("embed: empty batch");
    EmbeddingBatch b;
    b.dim = 26;
    for (auto& t : texts) {
      std::vector<float> v(26, 0.0f);
      for (char c : t) {
        if (std::isalpha(static_cast<unsigned char>(c)))
          v[std::tolower(static_cast<unsigned char>(c)) - 'a'] += 1.0f;
      }
      float n = 0.0f;
      for (float x : v) n += x * x;
      if (n > 0.0f) for (float& x : v) x /= std::sqrt(n);
      else v[0] = 1.0f;
      b.vectors.push_back(v);
    }
    ++calls;
    return b;
  }
  std::string name() const override { return "letters"; }

  int calls = 0;
};

// LetterEmbedder that throws on call number fail_on (1-based).
class FlakyEmbedder : public Embedder {
public:
  explicit FlakyEmbedder(int fail_on) : fail_on_(fail_on) {}

  EmbeddingBatch embed(const std::vector<std::string>& texts) override {
    if (++calls == fail_on_) throw EmbeddingError("embedding service dropped the connection");
    return inner_.embed(texts);
  }
  std::string name() const override { return "flaky"; }

  int calls = 0;

private:
  int fail_on_;
  LetterEmbedder inner_;
};

class FailingEmbedder : public Embedder {
public:
  EmbeddingBatch embed(const std::vector<std::string>&) override {
    throw EmbeddingError("embedding service unavailable");
  }
  std::string name() const override { return "failing"; }
};

// Returns a canned reply, or throws ChatError when reply is empty.
class FakeChatModel : public ChatModel {
public:
  explicit FakeChatModel(std::string reply) : reply_(std::move(reply)) {}

  std::string complete(const ChatRequest& req) override {
    last = req;
    ++calls;
    if (reply_.empty()) throw ChatError("upstream timed out");
    return reply_;
  }
  std::string name() const override { return "fake"; }
  int context_tokens() const override { return ctx_tokens; }

  ChatRequest last;
  int calls = 0;
  int ctx_tokens = 0;

private:
  std::string reply_;
};

// Score looked up by document text; unknown documents score 0.
class FakeCrossEncoder : public CrossEncoder {
public:
  explicit FakeCrossEncoder(std::map<std::string, float> scores) : scores_(std::move(scores)) {}

  float score(const std::string&, const std::string& doc) override {
    auto it = scores_.find(doc);
    return it == scores_.end() ? 0.0f : it->second;
  }

private:
  std::map<std::string, float> scores_;
};

// Fresh directory under the system temp dir, removed on scope exit.
class TempDir {
public:
  TempDir() {
    static std::atomic<int> seq{0};
    auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("guardrag_test_" + std::to_string(ts) + "_" + std::to_string(seq++));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }

private:
  std::filesystem::path path_;
};
