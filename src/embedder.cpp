// src/embedder.cpp
#include "embedder.hpp"
#include "text_util.hpp"
#include <llama.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>
#include <stdexcept>
#include <thread>

void l2_normalize(std::vector<float>& v) {
  double s = 0.0; for (float x : v) s += (double)x * (double)x;
  if (s <= 0.0) return;   // zero vector stays zero
  float norm = (float)std::sqrt(s);
  for (auto& x : v) x /= norm;
}

std::vector<float> Embedder::encode(const std::string& text) {
  auto out = encode_batch({text});
  if (out.size() != 1) throw std::runtime_error("embedder: expected one vector");
  return std::move(out[0]);
}

// ---------------------------------------------------------------- llama

struct LlamaEmbedder::Impl {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 1024;
  int dim = 0;

  Impl(const std::string& model_path, int ctx_size) : n_ctx(ctx_size) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0; // CPU
    model = llama_model_load_from_file(model_path.c_str(), mp);
    if (!model) fail("embedder: failed to load model " + model_path);

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;                 // whole input in one ubatch for non-causal models
    cp.embeddings = true;
    cp.pooling_type = LLAMA_POOLING_TYPE_MEAN;
    ctx = llama_init_from_model(model, cp);
    if (!ctx) fail("embedder: failed to create context");

    vocab = llama_model_get_vocab(model);
    dim = llama_model_n_embd(model);
    if (dim <= 0) fail("embedder: invalid embedding dim");
  }

  ~Impl() { release(); }

  void release() {
    if (ctx) llama_free(ctx);
    if (model) llama_model_free(model);
    ctx = nullptr;
    model = nullptr;
    llama_backend_free();
  }

  // The destructor does not run for a half-built Impl.
  [[noreturn]] void fail(const std::string& msg) {
    release();
    throw std::runtime_error(msg);
  }

  std::vector<llama_token> tokenize(const std::string& text) const {
    // first pass reports the required length as a negative count
    int32_t n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                               nullptr, 0, /*add_special=*/true, /*parse_special=*/false);
    int32_t needed = n < 0 ? -n : n;
    if (needed == 0) return {};
    std::vector<llama_token> toks(needed);
    n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                       toks.data(), (int32_t)toks.size(),
                       /*add_special=*/true, /*parse_special=*/false);
    if (n != needed) throw std::runtime_error("embedder: tokenize failed");
    return toks;
  }

  std::vector<float> encode_text(const std::string& text) {
    auto toks = tokenize(text);
    if (toks.empty()) return std::vector<float>(dim, 0.0f);
    if ((int)toks.size() > n_ctx) toks.resize(n_ctx);

    llama_memory_clear(llama_get_memory(ctx), true);

    llama_batch batch = llama_batch_init((int)toks.size(), /*embd*/ 0, /*n_seq*/ 1);
    for (int i = 0; i < (int)toks.size(); ++i) {
      batch.token[i] = toks[i];
      batch.pos[i] = i;
      batch.n_seq_id[i] = 1;
      batch.seq_id[i][0] = 0;
      batch.logits[i] = true;
    }
    batch.n_tokens = (int)toks.size();
    if (llama_decode(ctx, batch) != 0) {
      llama_batch_free(batch);
      throw std::runtime_error("embedder: llama_decode failed");
    }
    llama_batch_free(batch);

    const float* emb = llama_get_embeddings_seq(ctx, 0);
    if (!emb) emb = llama_get_embeddings(ctx);
    if (!emb) throw std::runtime_error("embedder: embeddings null");

    std::vector<float> v(emb, emb + dim);
    l2_normalize(v);
    return v;
  }
};

LlamaEmbedder::LlamaEmbedder(const std::string& embed_model_path, int n_ctx)
  : impl_(new Impl(embed_model_path, n_ctx)) {
  dim_ = impl_->dim;
}

LlamaEmbedder::~LlamaEmbedder() { delete impl_; }

std::vector<std::vector<float>> LlamaEmbedder::encode_batch(const std::vector<std::string>& texts) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (auto& t : texts) out.push_back(impl_->encode_text(t));
  return out;
}

std::vector<int> LlamaEmbedder::tokenize(const std::string& text) const {
  auto toks = impl_->tokenize(text);
  return std::vector<int>(toks.begin(), toks.end());
}

// ---------------------------------------------------------------- hash

HashEmbedder::HashEmbedder(int dim) : dim_(dim) {
  if (dim_ <= 0) throw std::invalid_argument("hash embedder: dim must be positive");
}

std::vector<std::vector<float>> HashEmbedder::encode_batch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (auto& text : texts) {
    std::vector<float> v(dim_, 0.0f);
    std::string word;
    auto flush = [&] {
      if (!word.empty()) v[fnv1a(word) % (uint64_t)dim_] += 1.0f;
      word.clear();
    };
    for (char c : text) {
      unsigned char u = (unsigned char)c;
      if (std::isalnum(u) || u >= 0x80) word += (char)std::tolower(u);
      else flush();
    }
    flush();
    l2_normalize(v);
    out.push_back(std::move(v));
  }
  return out;
}

// ---------------------------------------------------------------- service

static int resolve_dim(const Embedder* primary, int configured) {
  if (configured > 0) return configured;
  return primary ? primary->dim() : 384;
}

EmbeddingService::EmbeddingService(Embedder* primary, const EmbeddingConfig& config)
  : primary_(primary), config_(config), dim_(resolve_dim(primary, config.dimension)),
    fallback_(dim_), window_start_(std::chrono::steady_clock::now()) {
  if (config_.max_batch_size == 0) config_.max_batch_size = 1;
  if (config_.max_parallel_batches < 1) config_.max_parallel_batches = 1;
}

void EmbeddingService::wait_for_rate_limit() {
  if (config_.rate_limit_per_minute <= 0) return;
  std::unique_lock<std::mutex> lock(rate_mutex_);
  auto now = std::chrono::steady_clock::now();
  if (now - window_start_ >= std::chrono::minutes(1)) {
    window_start_ = now;
    requests_in_window_ = 0;
  }
  if (requests_in_window_ >= config_.rate_limit_per_minute) {
    auto wake = window_start_ + std::chrono::minutes(1);
    spdlog::debug("embedding rate limit reached, sleeping");
    std::this_thread::sleep_until(wake);
    window_start_ = std::chrono::steady_clock::now();
    requests_in_window_ = 0;
  }
  ++requests_in_window_;
}

// Returns false when the fallback had to be used.
bool EmbeddingService::embed_batch(const std::vector<std::string>& batch,
                                   std::vector<std::vector<float>>& out) {
  if (primary_) {
    try {
      wait_for_rate_limit();
      auto vecs = primary_->encode_batch(batch);
      if (vecs.size() != batch.size())
        throw std::runtime_error("embedder returned " + std::to_string(vecs.size()) +
                                 " vectors for " + std::to_string(batch.size()) + " texts");
      for (auto& v : vecs) {
        if ((int)v.size() != dim_)
          throw DimensionMismatch("embedding has dimension " + std::to_string(v.size()) +
                                  ", expected " + std::to_string(dim_));
      }
      out = std::move(vecs);
      return true;
    } catch (const std::exception& e) {
      spdlog::warn("embedding batch of {} failed ({}), using fallback embeddings", batch.size(), e.what());
    }
  }
  out = fallback_.encode_batch(batch);
  return false;
}

EmbeddingResult EmbeddingService::embed(const std::vector<std::string>& texts) {
  EmbeddingResult res;
  res.vectors.resize(texts.size());
  if (texts.empty()) return res;

  std::vector<std::pair<size_t, size_t>> ranges;   // [begin, end) per batch
  for (size_t b = 0; b < texts.size(); b += config_.max_batch_size)
    ranges.emplace_back(b, std::min(texts.size(), b + config_.max_batch_size));

  auto run = [&](size_t r) {
    std::vector<std::string> batch(texts.begin() + ranges[r].first, texts.begin() + ranges[r].second);
    std::vector<std::vector<float>> vecs;
    bool ok = embed_batch(batch, vecs);
    for (size_t i = 0; i < vecs.size(); ++i) res.vectors[ranges[r].first + i] = std::move(vecs[i]);
    return ok;
  };

  size_t wave = (size_t)config_.max_parallel_batches;
  for (size_t r = 0; r < ranges.size(); r += wave) {
    size_t end = std::min(ranges.size(), r + wave);
    if (end - r == 1) {
      if (!run(r)) ++res.fallback_batches;
      continue;
    }
    std::vector<std::future<bool>> pending;
    for (size_t j = r; j < end; ++j) pending.push_back(std::async(std::launch::async, run, j));
    for (auto& f : pending)
      if (!f.get()) ++res.fallback_batches;
  }
  total_fallbacks_ += res.fallback_batches;
  return res;
}

EmbeddingResult EmbeddingService::embed_query(const std::string& text) {
  return embed({text});
}
