#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "codelens_core/db/chunk_store.hpp"
#include "codelens_core/llm/embedding_provider.hpp"
#include "codelens_core/search/dependency_graph.hpp"
#include "codelens_core/search/keyword_index.hpp"
#include "codelens_core/search/signal_worker_pool.hpp"
#include "codelens_core/types/chunk.hpp"
#include "codelens_core/types/chunk_filter.hpp"

namespace codelens_core {

class InvalidWeightsError : public std::exception {
 public:
  explicit InvalidWeightsError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class SearchStrategy { Vector, Keyword, Dependency };
std::string to_string(SearchStrategy strategy);

struct SearchWeights {
  double vector = 0.5;
  double keyword = 0.3;
  double dependency = 0.2;
};

struct SearchQuery {
  std::optional<std::string> text;
  std::optional<std::vector<float>> embedding;
  std::optional<std::string> file_path;
  std::optional<int> top_k;            // engine default when unset
  std::optional<SearchWeights> weights;  // engine default when unset
  ChunkFilter filter;
  // Signals still running at the deadline are dropped from the result
  std::optional<std::chrono::milliseconds> timeout;
};

struct ScoreBreakdown {
  std::optional<double> vector;
  std::optional<double> keyword;
  std::optional<double> dependency;
};

struct SearchResult {
  CodeChunk chunk;
  double score = 0.0;
  ScoreBreakdown breakdown;
  std::vector<SearchStrategy> matched_by;
  SearchWeights weights;  // normalized weights used for this query
};

struct SearchStats {
  uint64_t total_searches = 0;
  double average_latency_ms = 0.0;
  uint64_t vector_hits = 0;
  uint64_t keyword_hits = 0;
  uint64_t dependency_hits = 0;
};

struct HybridSearchOptions {
  SearchWeights default_weights;
  int default_top_k = 5;
  // Vector candidates fetched per requested result, before merging
  int candidate_multiplier = 3;
  int max_dependency_hops = 2;
  double hop_decay = 0.5;
  // Threads running signals for searches with a timeout
  int signal_workers = 3;
};

/**
 * Ranks chunks by a weighted sum of vector similarity, keyword overlap and dependency
 * proximity. The keyword index and dependency graph are immutable snapshots swapped in
 * whole, so searches never observe a partially rebuilt index.
 */
class HybridSearchEngine {
 public:
  explicit HybridSearchEngine(std::shared_ptr<ChunkStore> store,
                              std::shared_ptr<EmbeddingProvider> embedder = nullptr,
                              HybridSearchOptions options = {});

  void build_keyword_index(const std::vector<CodeChunk>& chunks);
  void build_keyword_index_from_store();
  void set_dependency_graph(DependencyGraph graph);

  // Replaces one file's chunks in the store and the keyword index
  void update_file_index(const std::string& file_path, const std::vector<CodeChunk>& chunks);

  // Throws InvalidWeightsError, StoreClosedError, or DimensionMismatchError for a
  // query embedding of the wrong length. Other signal failures only drop that signal.
  std::vector<SearchResult> search(const SearchQuery& query);

  SearchStats get_stats() const;
  void reset_stats();

  std::string explain_search(const std::vector<SearchResult>& results) const;

  // Throws InvalidWeightsError on a negative weight; all-zero weights stay zero
  static SearchWeights normalize_weights(const SearchWeights& weights);

  size_t keyword_index_size() const;
  // Timed-out signals still queued or running
  size_t pending_signals() const;

 private:
  std::shared_ptr<const KeywordIndex> keyword_snapshot() const;
  void record_search(const std::vector<SearchResult>& results, double latency_ms);

  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  HybridSearchOptions options_;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const KeywordIndex> keyword_index_;
  std::shared_ptr<const DependencyGraph> graph_;
  std::shared_ptr<const DependencyGraph> reversed_graph_;

  // Serializes rebuilds so copy-on-write updates are not lost
  std::mutex rebuild_mutex_;

  mutable std::mutex stats_mutex_;
  SearchStats stats_;

  // Declared last so it is destroyed first, joining signals that still hold the store
  std::unique_ptr<SignalWorkerPool> signal_pool_;
};

}  // namespace codelens_core
