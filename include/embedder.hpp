#pragma once
#include "tokenizer.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown when an embedding's length disagrees with the configured dimension.
struct DimensionMismatch : std::runtime_error {
  using std::runtime_error::runtime_error;
};

class Embedder {
public:
  virtual ~Embedder() = default;

  // One unit-normalised vector per input, in input order.
  virtual std::vector<std::vector<float>> encode_batch(const std::vector<std::string>& texts) = 0;
  virtual int dim() const = 0;

  std::vector<float> encode(const std::string& text);
};

// GGUF embedding model through llama.cpp (mean pooling, CPU).
// Doubles as a Tokenizer backed by the model vocabulary.
class LlamaEmbedder : public Embedder, public Tokenizer {
public:
  explicit LlamaEmbedder(const std::string& embed_model_path, int n_ctx = 1024);
  ~LlamaEmbedder() override;
  LlamaEmbedder(const LlamaEmbedder&) = delete;
  LlamaEmbedder& operator=(const LlamaEmbedder&) = delete;

  std::vector<std::vector<float>> encode_batch(const std::vector<std::string>& texts) override;
  int dim() const override { return dim_; }
  std::vector<int> tokenize(const std::string& text) const override;

private:
  struct Impl;
  Impl* impl_;
  int dim_;
  std::mutex mutex_;   // one llama context, one caller at a time
};

// Bag-of-words feature hashing. Deterministic, needs no model; the
// substitute whenever the primary embedder is missing or fails.
class HashEmbedder : public Embedder {
public:
  explicit HashEmbedder(int dim = 384);
  std::vector<std::vector<float>> encode_batch(const std::vector<std::string>& texts) override;
  int dim() const override { return dim_; }

private:
  int dim_;
};

struct EmbeddingConfig {
  int dimension = 0;                  // 0: take the primary's, else 384
  size_t max_batch_size = 10;
  int rate_limit_per_minute = 0;      // batches per minute, 0 = unlimited
  int max_parallel_batches = 1;
};

struct EmbeddingResult {
  std::vector<std::vector<float>> vectors;
  size_t fallback_batches = 0;
  bool degraded() const { return fallback_batches > 0; }
};

// Batches texts through the primary embedder, checks every vector against
// the configured dimension and substitutes HashEmbedder output for batches
// that fail. Output order always equals input order.
class EmbeddingService {
public:
  EmbeddingService(Embedder* primary, const EmbeddingConfig& config = EmbeddingConfig{});

  EmbeddingResult embed(const std::vector<std::string>& texts);
  EmbeddingResult embed_query(const std::string& text);

  int dim() const { return dim_; }
  bool has_primary() const { return primary_ != nullptr; }
  size_t total_fallback_batches() const { return total_fallbacks_.load(); }

private:
  bool embed_batch(const std::vector<std::string>& batch, std::vector<std::vector<float>>& out);
  void wait_for_rate_limit();

  Embedder* primary_;
  EmbeddingConfig config_;
  int dim_;
  HashEmbedder fallback_;
  std::atomic<size_t> total_fallbacks_{0};
  std::mutex rate_mutex_;
  std::chrono::steady_clock::time_point window_start_;
  int requests_in_window_ = 0;
};

void l2_normalize(std::vector<float>& v);
