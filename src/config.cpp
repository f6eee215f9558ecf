#include "config.hpp"
#include "logging.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

static const char* kKeys[] = {
  "QDRANT_URL", "QDRANT_API_KEY", "GUARDRAG_INDEX_DIR", "EMBEDDING_MODEL", "RERANK_MODEL",
  "GROQ_API_KEY", "GROQ_MODEL", "GROQ_BASE_URL", "CHAT_MODEL", "GUARDRAG_CHAT_CTX",
  "GUARDRAG_TIMEOUT_MS", "GUARDRAG_LOG_LEVEL",
};

static std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n");
  auto b = s.find_last_not_of(" \t\r\n");
  if (a == std::string::npos) return "";
  return s.substr(a, b - a + 1);
}

Config load_config(const EnvMap& env) {
  Config c;
  auto set = [&](const char* key, std::string& dst) {
    auto it = env.find(key);
    if (it != env.end() && !it->second.empty()) dst = it->second;
  };
  set("QDRANT_URL", c.qdrant_url);
  set("QDRANT_API_KEY", c.qdrant_api_key);
  set("GUARDRAG_INDEX_DIR", c.index_dir);
  set("EMBEDDING_MODEL", c.embedding_model);
  set("RERANK_MODEL", c.rerank_model);
  set("GROQ_API_KEY", c.groq_api_key);
  set("GROQ_MODEL", c.groq_model);
  set("GROQ_BASE_URL", c.groq_base_url);
  set("CHAT_MODEL", c.chat_model);
  set("GUARDRAG_LOG_LEVEL", c.log_level);

  auto t = env.find("GUARDRAG_TIMEOUT_MS");
  if (t != env.end() && !t->second.empty()) {
    try {
      c.timeout_ms = std::stol(t->second);
    } catch (const std::exception&) {
      throw std::invalid_argument("GUARDRAG_TIMEOUT_MS is not a number: " + t->second);
    }
    if (c.timeout_ms <= 0) throw std::invalid_argument("GUARDRAG_TIMEOUT_MS must be positive");
  }

  auto n = env.find("GUARDRAG_CHAT_CTX");
  if (n != env.end() && !n->second.empty()) {
    try {
      c.chat_ctx = std::stoi(n->second);
    } catch (const std::exception&) {
      throw std::invalid_argument("GUARDRAG_CHAT_CTX is not a number: " + n->second);
    }
    if (c.chat_ctx < 0) throw std::invalid_argument("GUARDRAG_CHAT_CTX must not be negative");
  }
  return c;
}

EnvMap process_env() {
  EnvMap env;
  for (auto* k : kKeys) {
    if (const char* v = std::getenv(k)) env[k] = v;
  }
  return env;
}

EnvMap parse_dotenv(std::istream& in) {
  EnvMap out;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.compare(0, 7, "export ") == 0) line = trim(line.substr(7));
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front())
      val = val.substr(1, val.size() - 2);
    if (!key.empty()) out[key] = val;
  }
  return out;
}

void load_dotenv(const std::string& path) {
  std::ifstream in(path);
  if (!in) return;
  for (auto& kv : parse_dotenv(in)) {
    // overwrite=0 keeps the real environment authoritative
    if (setenv(kv.first.c_str(), kv.second.c_str(), 0) != 0)
      logger()->warn("could not set {} from {}", kv.first, path);
  }
}
