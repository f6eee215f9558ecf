#pragma once
#include "vector_store.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <memory>

// One hnswlib graph stored at <path>. Labels are assigned by the caller and
// stay stable across overwrite and delete.
class Index {
public:
  Index(const std::string& path, int dim, Distance distance, int M=16, int efC=200, int efS=64);
  ~Index();

  void add(uint64_t label, const std::vector<float>& vec);  // replaces an existing label
  void remove(uint64_t label);                              // mark-delete
  // (label, score) closest first; score grows with similarity.
  std::vector<std::pair<uint64_t, float>> search(const std::vector<float>& q, int k) const;

  void save(const std::string& path) const;  // writes the graph to path
  void load();         // loads from <path> (if exists)

  const std::string& path() const { return path_; }

  int dim() const { return dim_; }
  size_t size() const; // live elements

private:
  void ensure_capacity();
  std::vector<float> prepare(const std::vector<float>& v) const;

  std::string path_;
  int dim_, M_, efC_, efS_;
  Distance distance_;
  bool created_;
  // pimpl so headers stay light
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
