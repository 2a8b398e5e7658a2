#include "index.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

struct Index::Impl {
  std::unique_ptr<hnswlib::L2Space> space;   // vectors are unit length, so L2 ranks like cosine
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw;
};

Index::Index(const std::string& path, int dim, int M, int efC, int efS)
  : path_(path), dim_(dim), M_(M), efC_(efC), efS_(efS), created_(false), impl_(new Impl) {
  if (dim_ <= 0) throw std::invalid_argument("index: dimension must be positive");
}

Index::~Index() = default;

void Index::load() {
  impl_->space.reset(new hnswlib::L2Space(dim_));
  if (!path_.empty() && std::filesystem::exists(path_)) {
    impl_->hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl_->space.get(), path_, false, 0,
                                                          /*allow_replace_deleted=*/true));
  } else {
    // create empty index
    impl_->hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl_->space.get(), 10000 /*max_elements*/,
                                                          M_, efC_, 100, /*allow_replace_deleted=*/true));
  }
  impl_->hnsw->setEf(efS_);
  created_ = true;
}

void Index::save() const {
  if (!created_ || path_.empty()) return;
  impl_->hnsw->saveIndex(path_);
}

void Index::add(long long label, const std::vector<float>& vec) {
  if (!created_) load();
  if ((int)vec.size() != dim_) throw std::runtime_error("Index::add dimension mismatch");
  auto& h = *impl_->hnsw;
  auto it = h.label_lookup_.find((hnswlib::labeltype)label);
  if (it != h.label_lookup_.end()) {
    // a known label keeps its own slot; replace_deleted could move it to another
    // vacant slot and leave the old one still naming it
    if (h.isMarkedDeleted(it->second)) h.unmarkDelete((hnswlib::labeltype)label);
    h.addPoint((void*)vec.data(), (hnswlib::labeltype)label, /*replace_deleted=*/false);
    return;
  }
  if (h.getCurrentElementCount() >= h.getMaxElements()) h.resizeIndex(h.getMaxElements() * 2);
  h.addPoint((void*)vec.data(), (hnswlib::labeltype)label, /*replace_deleted=*/true);
}

void Index::remove(long long label) {
  if (!created_) return;
  auto& h = *impl_->hnsw;
  auto it = h.label_lookup_.find((hnswlib::labeltype)label);
  if (it == h.label_lookup_.end() || h.isMarkedDeleted(it->second)) return;
  h.markDelete((hnswlib::labeltype)label);
}

std::vector<std::pair<long long, float>> Index::search(const std::vector<float>& q, int k) const {
  if (!created_) throw std::runtime_error("Index not initialized");
  if ((int)q.size() != dim_) throw std::runtime_error("Index::search dimension mismatch");
  k = std::min(k, (int)size());
  if (k <= 0) return {};
  auto res = impl_->hnsw->searchKnn((void*)q.data(), (size_t)k);
  std::vector<std::pair<long long, float>> out; out.reserve(res.size());
  while (!res.empty()) { out.emplace_back((long long)res.top().second, res.top().first); res.pop(); }
  // the queue pops farthest first; reversing keeps closest -> farthest
  std::reverse(out.begin(), out.end());
  return out;
}

size_t Index::size() const {
  return created_ ? impl_->hnsw->getCurrentElementCount() - impl_->hnsw->getDeletedCount() : 0;
}
