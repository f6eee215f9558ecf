// src/filters.cpp
#include "filters.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
  return s;
}

std::vector<ScoredCandidate> apply_filters(const std::vector<ScoredCandidate>& cands,
                                           const Filter& filter) {
  if (filter.empty()) return cands;

  std::vector<std::unique_ptr<RE2>> regs;
  regs.reserve(filter.regex.size());
  for (auto& r : filter.regex) {
    if (r.empty()) continue;
    auto re = std::make_unique<RE2>(r, RE2::Quiet);
    if (!re->ok()) throw std::invalid_argument("bad regex '" + r + "': " + re->error());
    regs.push_back(std::move(re));
  }
  std::vector<std::string> keywords;
  for (auto& k : filter.keywords) if (!k.empty()) keywords.push_back(lower(k));

  std::vector<ScoredCandidate> hits;
  for (auto& c : cands) {
    // keyword filter
    if (!keywords.empty()) {
      std::string hay = lower(c.payload.source + " " + c.payload.text);
      bool ok = std::all_of(keywords.begin(), keywords.end(),
                            [&](const std::string& k) { return hay.find(k) != std::string::npos; });
      if (!ok) continue;
    }

    // regex pass
    if (!regs.empty()) {
      bool any = std::any_of(regs.begin(), regs.end(),
                             [&](const std::unique_ptr<RE2>& re) { return RE2::PartialMatch(c.payload.text, *re); });
      if (!any) continue;
    }
    hits.push_back(c);
  }
  return hits;
}
