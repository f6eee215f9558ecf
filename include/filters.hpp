#pragma once
#include "chunk.hpp"
#include <string>
#include <vector>

// Lexical half of hybrid retrieval, applied after the dense search.
struct Filter {
  std::vector<std::string> keywords; // all must appear (case-insensitive) in source + text
  std::vector<std::string> regex;    // RE2 syntax; at least one must match the text

  bool empty() const { return keywords.empty() && regex.empty(); }
};

// Keeps the input order. Invalid patterns throw std::invalid_argument.
std::vector<ScoredCandidate> apply_filters(const std::vector<ScoredCandidate>& candidates,
                                           const Filter& filter);
