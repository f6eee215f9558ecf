#include "index.hpp"
#include "errors.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <filesystem>

struct Index::Impl {
  std::unique_ptr<hnswlib::SpaceInterface<float>> space;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw;
};

static constexpr size_t kInitialCapacity = 1024;

Index::Index(const std::string& path, int dim, Distance distance, int M, int efC, int efS)
  : path_(path), dim_(dim), M_(M), efC_(efC), efS_(efS), distance_(distance),
    created_(false), impl_(new Impl) {}

Index::~Index() = default;

void Index::load() {
  if (dim_ <= 0) throw IndexError("Index: invalid dimension");
  // cosine and dot both use inner product; cosine vectors are normalized first
  if (distance_ == Distance::Euclid) impl_->space.reset(new hnswlib::L2Space(dim_));
  else impl_->space.reset(new hnswlib::InnerProductSpace(dim_));
  try {
    if (std::filesystem::exists(path_)) {
      impl_->hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl_->space.get(), path_));
    } else {
      impl_->hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl_->space.get(), kInitialCapacity, M_, efC_));
    }
  } catch (const std::exception& e) {
    throw IndexError(std::string("Index::load ") + path_ + ": " + e.what());
  }
  impl_->hnsw->setEf(efS_);
  created_ = true;
}

void Index::save(const std::string& path) const {
  if (!created_) return;
  try {
    impl_->hnsw->saveIndex(path);
  } catch (const std::exception& e) {
    throw IndexError(std::string("Index::save ") + path + ": " + e.what());
  }
}

std::vector<float> Index::prepare(const std::vector<float>& v) const {
  if ((int)v.size() != dim_) {
    throw IndexError("Index: dimension mismatch (expected " + std::to_string(dim_) +
                     ", got " + std::to_string(v.size()) + ")");
  }
  if (distance_ != Distance::Cosine) return v;
  double s = 0.0; for (float x : v) s += (double)x * (double)x;
  float norm = (float)std::sqrt(std::max(s, 1e-12));
  std::vector<float> out(v);
  for (auto& x : out) x /= norm;
  return out;
}

void Index::ensure_capacity() {
  auto& h = *impl_->hnsw;
  if (h.getCurrentElementCount() < h.getMaxElements()) return;
  h.resizeIndex(std::max<size_t>(h.getMaxElements() * 2, kInitialCapacity));
}

void Index::add(uint64_t label, const std::vector<float>& vec) {
  if (!created_) load();
  auto v = prepare(vec);
  try {
    ensure_capacity();
    impl_->hnsw->addPoint(v.data(), (hnswlib::labeltype)label);
  } catch (const std::exception& e) {
    throw IndexError(std::string("Index::add failed: ") + e.what());
  }
}

void Index::remove(uint64_t label) {
  if (!created_) load();
  try {
    impl_->hnsw->markDelete((hnswlib::labeltype)label);
  } catch (const std::exception& e) {
    throw IndexError(std::string("Index::remove failed: ") + e.what());
  }
}

std::vector<std::pair<uint64_t, float>> Index::search(const std::vector<float>& q, int k) const {
  if (!created_) throw IndexError("Index not initialized");
  auto v = prepare(q);
  std::priority_queue<std::pair<float, hnswlib::labeltype>> res;
  try {
    res = impl_->hnsw->searchKnn(v.data(), (size_t)k);
  } catch (const std::exception& e) {
    throw IndexError(std::string("Index::search failed: ") + e.what());
  }

  std::vector<std::pair<uint64_t, float>> out;
  out.reserve(res.size());
  // the queue pops farthest first
  while (!res.empty()) {
    float d = res.top().first;
    float score = distance_ == Distance::Euclid ? 1.0f / (1.0f + std::sqrt(std::max(d, 0.0f)))
                                                : 1.0f - d;
    out.emplace_back((uint64_t)res.top().second, score);
    res.pop();
  }
  std::reverse(out.begin(), out.end());
  return out;
}

size_t Index::size() const {
  if (!created_) return 0;
  return impl_->hnsw->getCurrentElementCount() - impl_->hnsw->getDeletedCount();
}
