#pragma once

#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codelens_core/cache/semantic_cache.hpp"
#include "codelens_core/db/chunk_store.hpp"
#include "codelens_core/indexing/incremental_indexer.hpp"
#include "codelens_core/search/hybrid_search_engine.hpp"

namespace codelens_core {

class ConfigError : public std::exception {
 public:
  explicit ConfigError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class Config {
 public:
  // Chunk store
  std::string storage_path;
  int embedding_dimension;
  std::string similarity_metric;
  int db_pool_size;

  // Hybrid search
  int search_top_k;
  SearchWeights search_weights;
  int search_timeout_ms;  // 0 disables the timeout

  // Incremental indexer
  std::string project_root;
  std::string metadata_path;  // empty means <project_root>/.codelens/index-metadata.json
  std::vector<std::string> extensions;
  std::vector<std::string> ignore_dirs;
  bool enable_git;

  // Semantic cache
  int cache_max_entries;
  int cache_ttl_hours;
  double cache_similarity_threshold;
  bool cache_enable_semantic_matching;
  std::string cache_persist_path;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;
    const nlohmann::json empty = nlohmann::json::object();

    try {
      config.storage_path = json_config.value("storage_path", std::string("./.codelens/store"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1536);
      config.similarity_metric = json_config.value("similarity_metric", std::string("cosine"));
      config.db_pool_size = json_config.value("db_pool_size", 4);

      const nlohmann::json& search = json_config.contains("search") ? json_config.at("search") : empty;
      config.search_top_k = search.value("top_k", 5);
      config.search_timeout_ms = search.value("timeout_ms", 0);
      const nlohmann::json& weights = search.contains("weights") ? search.at("weights") : empty;
      config.search_weights.vector = weights.value("vector", 0.5);
      config.search_weights.keyword = weights.value("keyword", 0.3);
      config.search_weights.dependency = weights.value("dependency", 0.2);

      const nlohmann::json& indexer =
          json_config.contains("indexer") ? json_config.at("indexer") : empty;
      config.project_root = indexer.value("project_root", std::string("."));
      config.metadata_path = indexer.value("metadata_path", std::string());
      config.extensions = indexer.value(
          "extensions",
          std::vector<std::string>{".ts", ".tsx", ".js", ".jsx", ".h", ".hpp", ".cc", ".cpp"});
      config.ignore_dirs = indexer.value(
          "ignore_dirs", std::vector<std::string>{"node_modules", "dist", ".next", "build", ".git",
                                                  ".codelens"});
      config.enable_git = indexer.value("enable_git", true);

      const nlohmann::json& cache = json_config.contains("cache") ? json_config.at("cache") : empty;
      config.cache_max_entries = cache.value("max_entries", 1000);
      config.cache_ttl_hours = cache.value("ttl_hours", 24 * 7);
      config.cache_similarity_threshold = cache.value("similarity_threshold", 0.85);
      config.cache_enable_semantic_matching = cache.value("enable_semantic_matching", true);
      config.cache_persist_path = cache.value("persist_path", std::string());
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

  ChunkStoreOptions chunk_store_options() const {
    ChunkStoreOptions options;
    options.storage_path = storage_path;
    options.dimension = static_cast<size_t>(embedding_dimension);
    options.metric = similarity_metric_from_string(similarity_metric);
    options.pool_size = db_pool_size;
    return options;
  }

  HybridSearchOptions search_options() const {
    HybridSearchOptions options;
    options.default_weights = search_weights;
    options.default_top_k = search_top_k;
    return options;
  }

  std::optional<std::chrono::milliseconds> search_timeout() const {
    if (search_timeout_ms <= 0) {
      return std::nullopt;
    }
    return std::chrono::milliseconds(search_timeout_ms);
  }

  IndexerOptions indexer_options() const {
    IndexerOptions options;
    options.scan.root = project_root;
    options.scan.extensions = std::set<std::string>(extensions.begin(), extensions.end());
    options.scan.ignore_dirs = std::set<std::string>(ignore_dirs.begin(), ignore_dirs.end());
    if (!metadata_path.empty()) {
      options.metadata_path = metadata_path;
    }
    options.enable_git = enable_git;
    return options;
  }

  SemanticCacheOptions cache_options() const {
    SemanticCacheOptions options;
    options.max_entries = static_cast<size_t>(cache_max_entries);
    options.ttl = std::chrono::hours(cache_ttl_hours);
    options.similarity_threshold = cache_similarity_threshold;
    options.enable_semantic_matching = cache_enable_semantic_matching;
    return options;
  }

 private:
  void validate() const {
    if (storage_path.empty()) {
      throw ConfigError("storage_path cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw ConfigError("embedding_dimension must be greater than 0");
    }
    if (similarity_metric != "cosine" && similarity_metric != "inner_product" &&
        similarity_metric != "dot") {
      throw ConfigError("similarity_metric must be one of: cosine, inner_product, dot");
    }
    if (db_pool_size <= 0) {
      throw ConfigError("db_pool_size must be greater than 0");
    }
    if (search_top_k <= 0) {
      throw ConfigError("search.top_k must be greater than 0");
    }
    if (search_weights.vector < 0 || search_weights.keyword < 0 || search_weights.dependency < 0) {
      throw ConfigError("search.weights must be non-negative");
    }
    if (search_timeout_ms < 0) {
      throw ConfigError("search.timeout_ms cannot be negative");
    }
    if (project_root.empty()) {
      throw ConfigError("indexer.project_root cannot be empty");
    }
    if (extensions.empty()) {
      throw ConfigError("indexer.extensions cannot be empty");
    }
    if (cache_max_entries <= 0) {
      throw ConfigError("cache.max_entries must be greater than 0");
    }
    if (cache_ttl_hours < 1) {
      throw ConfigError("cache.ttl_hours must be at least 1 hour");
    }
    if (cache_similarity_threshold < 0.0 || cache_similarity_threshold > 1.0) {
      throw ConfigError("cache.similarity_threshold must be within [0, 1]");
    }
  }
};

}  // namespace codelens_core
