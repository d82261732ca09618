#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "codelens_core/llm/embedding_provider.hpp"
#include "codelens_core/types/llm.hpp"

namespace codelens_core {

// Raised only for persistence failures; a lookup miss is never an error.
class CacheError : public std::exception {
 public:
  explicit CacheError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct SemanticCacheOptions {
  size_t max_entries = 1000;
  std::chrono::milliseconds ttl = std::chrono::hours(24 * 7);
  double similarity_threshold = 0.85;
  bool enable_semantic_matching = true;
};

enum class CacheHitKind { Exact, Semantic };

struct CacheLookup {
  LlmResponse response;
  CacheHitKind kind = CacheHitKind::Exact;
  double similarity = 1.0;
  std::string fingerprint;  // of the entry that answered
};

struct CacheStats {
  size_t entries = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  double hit_rate = 0.0;
  uint64_t exact_hits = 0;
  uint64_t semantic_hits = 0;
  double average_similarity = 0.0;  // over semantic hits
  uint64_t tokens_saved = 0;
};

/**
 * Response cache for generation requests. Lookups try the exact request fingerprint first,
 * then the most similar stored prompt of the same provider and model.
 * Capacity is bounded with least-recently-used eviction; entries expire after the TTL.
 */
class SemanticCache {
 public:
  explicit SemanticCache(SemanticCacheOptions options = {},
                         std::shared_ptr<EmbeddingProvider> embedder = nullptr);

  // SHA-256 of provider|model|prompt|temperature|max_tokens
  static std::string fingerprint(const LlmRequest& request);

  void set(const LlmRequest& request,
           const LlmResponse& response,
           std::optional<std::vector<float>> embedding = std::nullopt);

  std::optional<CacheLookup> get(const LlmRequest& request,
                                 std::optional<std::vector<float>> embedding = std::nullopt);

  CacheStats get_stats() const;
  void reset_stats();
  void clear();
  size_t size() const;

  void save(const std::filesystem::path& path) const;
  // Returns how many entries were loaded; a missing file loads nothing
  size_t load(const std::filesystem::path& path);

 private:
  struct Entry {
    std::string fingerprint;
    LlmRequest request;
    LlmResponse response;
    std::optional<std::vector<float>> embedding;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_accessed;
    uint64_t hit_count = 0;
    std::list<std::string>::iterator lru_it;
  };

  std::optional<std::vector<float>> embed_prompt(const std::string& prompt) const;
  bool is_expired(const Entry& entry, std::chrono::system_clock::time_point now) const;
  void touch(Entry& entry, std::chrono::system_clock::time_point now);
  void insert_locked(Entry entry);
  void erase_locked(const std::string& fingerprint);
  void record_hit(const LlmResponse& response, CacheHitKind kind, double similarity);

  SemanticCacheOptions options_;
  std::shared_ptr<EmbeddingProvider> embedder_;

  mutable std::mutex mutex_;
  std::list<std::string> lru_;  // front = most recently used
  std::unordered_map<std::string, Entry> entries_;

  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t exact_hits_ = 0;
  uint64_t semantic_hits_ = 0;
  double similarity_sum_ = 0.0;
  uint64_t tokens_saved_ = 0;
};

}  // namespace codelens_core
