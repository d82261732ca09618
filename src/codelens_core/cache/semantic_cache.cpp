#include "codelens_core/cache/semantic_cache.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "codelens_core/services/hash_service.hpp"
#include "codelens_core/utils/atomic_file.hpp"

namespace codelens_core {

namespace {

constexpr const char* CACHE_FILE_VERSION = "1.0.0";

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  const size_t d = a.size();
  const float norms = faiss::fvec_norm_L2sqr(a.data(), d) * faiss::fvec_norm_L2sqr(b.data(), d);
  if (norms <= 0.0f) {
    return 0.0;
  }
  return faiss::fvec_inner_product(a.data(), b.data(), d) / std::sqrt(norms);
}

int64_t to_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_ms(int64_t ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

nlohmann::json request_to_json(const LlmRequest& request) {
  return {{"provider", request.provider},
          {"model", request.model},
          {"prompt", request.prompt},
          {"temperature", request.temperature},
          {"maxTokens", request.max_tokens}};
}

LlmRequest request_from_json(const nlohmann::json& j) {
  LlmRequest request;
  request.provider = j.at("provider").get<std::string>();
  request.model = j.at("model").get<std::string>();
  request.prompt = j.at("prompt").get<std::string>();
  request.temperature = j.value("temperature", 0.0);
  request.max_tokens = j.value("maxTokens", 0);
  return request;
}

nlohmann::json response_to_json(const LlmResponse& response) {
  return {{"content", response.content},
          {"usage",
           {{"promptTokens", response.usage.prompt_tokens},
            {"completionTokens", response.usage.completion_tokens},
            {"totalTokens", response.usage.total_tokens}}},
          {"finishReason", response.finish_reason}};
}

LlmResponse response_from_json(const nlohmann::json& j) {
  LlmResponse response;
  response.content = j.at("content").get<std::string>();
  response.finish_reason = j.value("finishReason", std::string());
  if (j.contains("usage")) {
    const auto& usage = j.at("usage");
    response.usage.prompt_tokens = usage.value("promptTokens", 0);
    response.usage.completion_tokens = usage.value("completionTokens", 0);
    response.usage.total_tokens = usage.value("totalTokens", 0);
  }
  return response;
}

}  // namespace

SemanticCache::SemanticCache(SemanticCacheOptions options,
                             std::shared_ptr<EmbeddingProvider> embedder)
    : options_(options), embedder_(std::move(embedder)) {
  if (options_.max_entries == 0) {
    throw std::invalid_argument("SemanticCache max_entries must be greater than 0");
  }
  if (options_.ttl.count() <= 0) {
    throw std::invalid_argument("SemanticCache ttl must be positive");
  }
  if (options_.similarity_threshold < 0.0 || options_.similarity_threshold > 1.0) {
    throw std::invalid_argument("SemanticCache similarity_threshold must be within [0, 1]");
  }
}

std::string SemanticCache::fingerprint(const LlmRequest& request) {
  std::ostringstream key;
  key << request.provider << "|" << request.model << "|" << request.prompt << "|" << std::fixed
      << std::setprecision(2) << request.temperature << "|" << request.max_tokens;
  return HashService::sha256_hex(key.str());
}

std::optional<std::vector<float>> SemanticCache::embed_prompt(const std::string& prompt) const {
  if (!embedder_) {
    return std::nullopt;
  }
  try {
    return embedder_->embed(prompt);
  } catch (const EmbeddingError& e) {
    std::cerr << "Warning: [SemanticCache] prompt embedding unavailable: " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

bool SemanticCache::is_expired(const Entry& entry, std::chrono::system_clock::time_point now) const {
  return now - entry.created_at > options_.ttl;
}

void SemanticCache::touch(Entry& entry, std::chrono::system_clock::time_point now) {
  entry.last_accessed = now;
  entry.hit_count++;
  lru_.splice(lru_.begin(), lru_, entry.lru_it);
}

void SemanticCache::erase_locked(const std::string& fingerprint) {
  auto it = entries_.find(fingerprint);
  if (it == entries_.end()) {
    return;
  }
  lru_.erase(it->second.lru_it);
  entries_.erase(it);
}

void SemanticCache::insert_locked(Entry entry) {
  erase_locked(entry.fingerprint);

  if (entries_.size() >= options_.max_entries) {
    const auto now = std::chrono::system_clock::now();
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (is_expired(it->second, now)) {
        lru_.erase(it->second.lru_it);
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }
  while (entries_.size() >= options_.max_entries && !lru_.empty()) {
    const std::string victim = lru_.back();
    lru_.pop_back();
    entries_.erase(victim);
  }

  lru_.push_front(entry.fingerprint);
  entry.lru_it = lru_.begin();
  std::string key = entry.fingerprint;
  entries_.emplace(std::move(key), std::move(entry));
}

void SemanticCache::record_hit(const LlmResponse& response, CacheHitKind kind, double similarity) {
  hits_++;
  if (kind == CacheHitKind::Exact) {
    exact_hits_++;
  } else {
    semantic_hits_++;
    similarity_sum_ += similarity;
  }
  if (response.usage.total_tokens > 0) {
    tokens_saved_ += static_cast<uint64_t>(response.usage.total_tokens);
  }
}

void SemanticCache::set(const LlmRequest& request,
                        const LlmResponse& response,
                        std::optional<std::vector<float>> embedding) {
  if (!embedding && options_.enable_semantic_matching) {
    embedding = embed_prompt(request.prompt);
  }

  const auto now = std::chrono::system_clock::now();
  Entry entry;
  entry.fingerprint = fingerprint(request);
  entry.request = request;
  entry.response = response;
  entry.embedding = std::move(embedding);
  entry.created_at = now;
  entry.last_accessed = now;

  std::lock_guard<std::mutex> lock(mutex_);
  insert_locked(std::move(entry));
}

std::optional<CacheLookup> SemanticCache::get(const LlmRequest& request,
                                              std::optional<std::vector<float>> embedding) {
  const std::string key = fingerprint(request);
  auto now = std::chrono::system_clock::now();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      if (is_expired(it->second, now)) {
        erase_locked(key);
      } else {
        touch(it->second, now);
        record_hit(it->second.response, CacheHitKind::Exact, 1.0);
        return CacheLookup{it->second.response, CacheHitKind::Exact, 1.0, key};
      }
    }

    const bool has_candidates =
        options_.enable_semantic_matching &&
        std::any_of(entries_.begin(), entries_.end(), [&](const auto& item) {
          const Entry& e = item.second;
          return e.embedding && e.request.provider == request.provider &&
                 e.request.model == request.model;
        });
    if (!has_candidates) {
      misses_++;
      return std::nullopt;
    }
  }

  // Embedding may call out to a model, so it runs without the lock
  if (!embedding) {
    embedding = embed_prompt(request.prompt);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!embedding || embedding->empty()) {
    misses_++;
    return std::nullopt;
  }

  now = std::chrono::system_clock::now();
  Entry* best = nullptr;
  double best_similarity = -1.0;
  std::vector<std::string> expired;
  for (auto& [fp, entry] : entries_) {
    if (is_expired(entry, now)) {
      expired.push_back(fp);
      continue;
    }
    if (!entry.embedding || entry.embedding->size() != embedding->size())
      continue;
    if (entry.request.provider != request.provider || entry.request.model != request.model)
      continue;
    double similarity = cosine_similarity(*embedding, *entry.embedding);
    if (similarity > best_similarity ||
        (similarity == best_similarity && best && fp < best->fingerprint)) {
      best = &entry;
      best_similarity = similarity;
    }
  }

  std::optional<CacheLookup> result;
  if (best && best_similarity >= options_.similarity_threshold) {
    touch(*best, now);
    record_hit(best->response, CacheHitKind::Semantic, best_similarity);
    result = CacheLookup{best->response, CacheHitKind::Semantic, best_similarity,
                         best->fingerprint};
  } else {
    misses_++;
  }

  for (const auto& fp : expired) {
    erase_locked(fp);
  }
  return result;
}

CacheStats SemanticCache::get_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats;
  stats.entries = entries_.size();
  stats.hits = hits_;
  stats.misses = misses_;
  const uint64_t lookups = hits_ + misses_;
  stats.hit_rate = lookups == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(lookups);
  stats.exact_hits = exact_hits_;
  stats.semantic_hits = semantic_hits_;
  stats.average_similarity =
      semantic_hits_ == 0 ? 0.0 : similarity_sum_ / static_cast<double>(semantic_hits_);
  stats.tokens_saved = tokens_saved_;
  return stats;
}

void SemanticCache::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  hits_ = 0;
  misses_ = 0;
  exact_hits_ = 0;
  semantic_hits_ = 0;
  similarity_sum_ = 0.0;
  tokens_saved_ = 0;
}

void SemanticCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  lru_.clear();
}

size_t SemanticCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void SemanticCache::save(const std::filesystem::path& path) const {
  nlohmann::json entries = nlohmann::json::array();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Least recently used first, so a reload rebuilds the same recency order
    for (auto it = lru_.rbegin(); it != lru_.rend(); ++it) {
      const Entry& entry = entries_.at(*it);
      nlohmann::json item = {{"fingerprint", entry.fingerprint},
                             {"request", request_to_json(entry.request)},
                             {"response", response_to_json(entry.response)},
                             {"createdAt", to_ms(entry.created_at)},
                             {"lastAccessed", to_ms(entry.last_accessed)},
                             {"hitCount", entry.hit_count}};
      if (entry.embedding) {
        item["embedding"] = *entry.embedding;
      }
      entries.push_back(std::move(item));
    }
  }

  nlohmann::json document = {{"version", CACHE_FILE_VERSION}, {"entries", entries}};
  try {
    write_file_atomically(path, document.dump());
  } catch (const std::exception& e) {
    throw CacheError("Failed to save cache to " + path.string() + ": " + e.what());
  }
  std::cout << "[SemanticCache] Saved " << entries.size() << " entries to " << path.string()
            << std::endl;
}

size_t SemanticCache::load(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return 0;
  }

  std::ifstream file_stream(path);
  if (!file_stream.is_open()) {
    throw CacheError("Failed to open cache file: " + path.string());
  }

  std::vector<Entry> loaded;
  const auto now = std::chrono::system_clock::now();
  try {
    nlohmann::json document;
    file_stream >> document;
    for (const auto& item : document.at("entries")) {
      Entry entry;
      entry.request = request_from_json(item.at("request"));
      entry.response = response_from_json(item.at("response"));
      entry.fingerprint = fingerprint(entry.request);
      entry.created_at = from_ms(item.at("createdAt").get<int64_t>());
      entry.last_accessed = from_ms(item.value("lastAccessed", item.at("createdAt").get<int64_t>()));
      entry.hit_count = item.value("hitCount", uint64_t{0});
      if (item.contains("embedding")) {
        entry.embedding = item.at("embedding").get<std::vector<float>>();
      }
      if (is_expired(entry, now))
        continue;
      loaded.push_back(std::move(entry));
    }
  } catch (const nlohmann::json::exception& e) {
    throw CacheError("Failed to parse cache file '" + path.string() + "': " + e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : loaded) {
    insert_locked(std::move(entry));
  }
  std::cout << "[SemanticCache] Loaded " << loaded.size() << " entries from " << path.string()
            << std::endl;
  return loaded.size();
}

}  // namespace codelens_core
