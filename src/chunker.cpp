#include "chunker.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cstdint>
#include <random>
#include <sstream>
#include <stdexcept>

using std::string;

string normalize_ws(const string& text) {
  static const RE2 ws("[\\s\\v]+");
  string out = text;
  RE2::GlobalReplace(&out, ws, " ");
  auto a = out.find_first_not_of(' ');
  if (a == string::npos) return "";
  auto b = out.find_last_not_of(' ');
  return out.substr(a, b - a + 1);
}

std::vector<string> chunk_words(const string& text, int size, int overlap) {
  if (size <= 0) throw std::invalid_argument("chunk size must be positive");
  if (overlap < 0) throw std::invalid_argument("chunk overlap must not be negative");

  std::vector<string> words;
  {
    std::istringstream in(text);
    string w;
    while (in >> w) words.push_back(std::move(w));
  }

  std::vector<string> chunks;
  const int n = (int)words.size();
  for (int start = 0; start < n; ) {
    int end = std::min(n, start + size);
    string chunk;
    for (int i = start; i < end; ++i) {
      if (i > start) chunk += ' ';
      chunk += words[i];
    }
    chunks.push_back(std::move(chunk));

    if (end == n) break;
    int next = end - overlap;
    if (next < 0) next = 0;
    // overlap >= size would stall here; always move at least one word
    start = std::max(next, start + 1);
  }
  return chunks;
}

std::vector<DocumentChunk> chunk_document(const string& text, const string& doc_id,
                                          const string& source, int size, int overlap) {
  auto parts = chunk_words(text, size, overlap);
  std::vector<DocumentChunk> out;
  out.reserve(parts.size());
  for (size_t i = 0; i < parts.size(); ++i) {
    DocumentChunk c;
    c.id = make_uuid();
    c.text = std::move(parts[i]);
    c.doc_id = doc_id;
    c.source = source;
    c.chunk_index = (int)i;
    out.push_back(std::move(c));
  }
  return out;
}

string make_uuid() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t hi = dist(rng), lo = dist(rng);
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

  static const char* hex = "0123456789abcdef";
  string s;
  s.reserve(36);
  for (int i = 0; i < 32; ++i) {
    uint64_t word = i < 16 ? hi : lo;
    int shift = 60 - 4 * (i % 16);
    s += hex[(word >> shift) & 0xF];
    if (i == 7 || i == 11 || i == 15 || i == 19) s += '-';
  }
  return s;
}
