#include "codelens_core/search/hybrid_search_engine.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace codelens_core {

namespace {

struct SignalHit {
  CodeChunk chunk;
  double score = 0.0;
};
using SignalScores = std::unordered_map<std::string, SignalHit>;

double clamp_unit(double v) {
  return std::max(0.0, std::min(1.0, v));
}

double weight_for(const SearchWeights& weights, SearchStrategy strategy) {
  switch (strategy) {
    case SearchStrategy::Vector:
      return weights.vector;
    case SearchStrategy::Keyword:
      return weights.keyword;
    case SearchStrategy::Dependency:
      return weights.dependency;
  }
  return 0.0;
}

SignalScores run_vector_signal(const std::shared_ptr<ChunkStore>& store,
                               const std::shared_ptr<EmbeddingProvider>& embedder,
                               const SearchQuery& query,
                               size_t candidates) {
  std::optional<std::vector<float>> embedding = query.embedding;
  if (!embedding && query.text && embedder) {
    try {
      embedding = embedder->embed(*query.text);
    } catch (const EmbeddingError& e) {
      std::cerr << "Warning: [HybridSearch] query embedding unavailable: " << e.what()
                << std::endl;
      return {};
    }
  }
  if (!embedding || !store) {
    return {};
  }
  if (!query.embedding && embedding->size() != store->dimension() && store->is_open()) {
    std::cerr << "Warning: [HybridSearch] provider embedding has " << embedding->size()
              << " dimensions, store expects " << store->dimension() << std::endl;
    return {};
  }

  const bool cosine = store->metric() == SimilarityMetric::Cosine;
  SignalScores scores;
  for (auto& match : store->search(*embedding, candidates, query.filter)) {
    double s = cosine ? (match.similarity + 1.0) / 2.0 : match.similarity;
    std::string id = match.chunk.id;
    scores.emplace(std::move(id), SignalHit{std::move(match.chunk), clamp_unit(s)});
  }
  return scores;
}

SignalScores run_keyword_signal(const std::shared_ptr<const KeywordIndex>& index,
                                const SearchQuery& query) {
  std::vector<std::string> terms;
  std::unordered_set<std::string> seen;
  for (auto& term : KeywordIndex::tokenize(*query.text)) {
    if (seen.insert(term).second) {
      terms.push_back(std::move(term));
    }
  }
  if (terms.empty()) {
    return {};
  }

  SignalScores scores;
  for (const auto& [id, match] : index->search(terms)) {
    const CodeChunk* chunk = index->chunk(id);
    if (!chunk || !query.filter.matches(*chunk))
      continue;
    double overlap = static_cast<double>(match.matched_terms) / static_cast<double>(terms.size());
    double boost = std::min(0.2, 0.05 * std::log1p(static_cast<double>(match.term_frequency)));
    scores.emplace(id, SignalHit{*chunk, clamp_unit(overlap * (1.0 + boost))});
  }
  return scores;
}

SignalScores run_dependency_signal(const std::shared_ptr<const KeywordIndex>& index,
                                   const std::shared_ptr<const DependencyGraph>& graph,
                                   const std::shared_ptr<const DependencyGraph>& reversed,
                                   const SearchQuery& query,
                                   int max_hops,
                                   double hop_decay) {
  SignalScores scores;
  for (const auto& [file, hop] : neighbors_within(*graph, *reversed, *query.file_path, max_hops)) {
    double score = std::pow(hop_decay, hop - 1);
    for (const CodeChunk* chunk : index->chunks_in_file(file)) {
      if (!query.filter.matches(*chunk))
        continue;
      scores.emplace(chunk->id, SignalHit{*chunk, clamp_unit(score)});
    }
  }
  return scores;
}

}  // namespace

std::string to_string(SearchStrategy strategy) {
  switch (strategy) {
    case SearchStrategy::Vector:
      return "vector";
    case SearchStrategy::Keyword:
      return "keyword";
    case SearchStrategy::Dependency:
      return "dependency";
    default:
      return "unknown";
  }
}

HybridSearchEngine::HybridSearchEngine(std::shared_ptr<ChunkStore> store,
                                       std::shared_ptr<EmbeddingProvider> embedder,
                                       HybridSearchOptions options)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      options_(options),
      keyword_index_(std::make_shared<KeywordIndex>()),
      graph_(std::make_shared<DependencyGraph>()),
      reversed_graph_(std::make_shared<DependencyGraph>()) {
  options_.default_weights = normalize_weights(options_.default_weights);
  if (options_.default_top_k <= 0) {
    throw std::invalid_argument("default_top_k must be greater than 0");
  }
  if (options_.candidate_multiplier <= 0) {
    throw std::invalid_argument("candidate_multiplier must be greater than 0");
  }
  if (options_.signal_workers <= 0) {
    throw std::invalid_argument("signal_workers must be greater than 0");
  }
  signal_pool_ = std::make_unique<SignalWorkerPool>(static_cast<size_t>(options_.signal_workers));
}

void HybridSearchEngine::build_keyword_index(const std::vector<CodeChunk>& chunks) {
  std::cout << "[HybridSearch] Building keyword index for " << chunks.size() << " chunks"
            << std::endl;
  auto next = std::make_shared<KeywordIndex>();
  next->build(chunks);

  std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  keyword_index_ = std::move(next);
}

void HybridSearchEngine::build_keyword_index_from_store() {
  if (!store_) {
    throw std::logic_error("HybridSearchEngine has no chunk store");
  }
  build_keyword_index(store_->get_all_chunks());
}

void HybridSearchEngine::set_dependency_graph(DependencyGraph graph) {
  auto reversed = std::make_shared<const DependencyGraph>(reverse_graph(graph));
  auto forward = std::make_shared<const DependencyGraph>(std::move(graph));
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  graph_ = std::move(forward);
  reversed_graph_ = std::move(reversed);
}

void HybridSearchEngine::update_file_index(const std::string& file_path,
                                           const std::vector<CodeChunk>& chunks) {
  std::optional<DimensionMismatchError> rejected;
  std::vector<CodeChunk> accepted;
  if (store_) {
    try {
      store_->update_file(file_path, chunks);
    } catch (const DimensionMismatchError& e) {
      rejected = e;
    }
    for (const auto& chunk : chunks) {
      if (chunk.embedding.size() == store_->dimension()) {
        accepted.push_back(chunk);
      }
    }
  } else {
    accepted = chunks;
  }

  {
    std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);
    auto next = std::make_shared<KeywordIndex>(*keyword_snapshot());
    next->update_file(file_path, accepted);
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    keyword_index_ = std::move(next);
  }

  if (rejected) {
    throw *rejected;
  }
}

std::shared_ptr<const KeywordIndex> HybridSearchEngine::keyword_snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return keyword_index_;
}

size_t HybridSearchEngine::keyword_index_size() const {
  return keyword_snapshot()->size();
}

size_t HybridSearchEngine::pending_signals() const {
  return signal_pool_->pending();
}

SearchWeights HybridSearchEngine::normalize_weights(const SearchWeights& weights) {
  // !(w >= 0) also rejects NaN
  if (!(weights.vector >= 0.0) || !(weights.keyword >= 0.0) || !(weights.dependency >= 0.0)) {
    std::stringstream ss;
    ss << "Search weights must be non-negative (vector=" << weights.vector
       << ", keyword=" << weights.keyword << ", dependency=" << weights.dependency << ")";
    throw InvalidWeightsError(ss.str());
  }
  const double sum = weights.vector + weights.keyword + weights.dependency;
  if (sum == 0.0 || std::fabs(sum - 1.0) < 1e-9) {
    return weights;
  }
  return {weights.vector / sum, weights.keyword / sum, weights.dependency / sum};
}

std::vector<SearchResult> HybridSearchEngine::search(const SearchQuery& query) {
  const SearchWeights weights = normalize_weights(query.weights.value_or(options_.default_weights));
  const auto start = std::chrono::steady_clock::now();
  const int top_k = query.top_k.value_or(options_.default_top_k);

  std::shared_ptr<const KeywordIndex> index;
  std::shared_ptr<const DependencyGraph> graph;
  std::shared_ptr<const DependencyGraph> reversed;
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    index = keyword_index_;
    graph = graph_;
    reversed = reversed_graph_;
  }

  struct PlannedSignal {
    SearchStrategy strategy;
    std::function<SignalScores()> run;
  };
  std::vector<PlannedSignal> plan;

  if (top_k > 0) {
    const bool has_embedding_source = query.embedding || (query.text && embedder_);
    if (weights.vector > 0.0 && has_embedding_source && store_) {
      if (query.embedding && query.embedding->size() != store_->dimension()) {
        throw DimensionMismatchError("Query embedding has " +
                                         std::to_string(query.embedding->size()) +
                                         " dimensions, store expects " +
                                         std::to_string(store_->dimension()),
                                     store_->dimension(), {});
      }
      const size_t candidates =
          static_cast<size_t>(top_k) * static_cast<size_t>(options_.candidate_multiplier);
      auto store = store_;
      auto embedder = embedder_;
      plan.push_back({SearchStrategy::Vector, [store, embedder, query, candidates]() {
                        return run_vector_signal(store, embedder, query, candidates);
                      }});
    }
    if (weights.keyword > 0.0 && query.text) {
      plan.push_back({SearchStrategy::Keyword,
                      [index, query]() { return run_keyword_signal(index, query); }});
    }
    if (weights.dependency > 0.0 && query.file_path) {
      const int max_hops = options_.max_dependency_hops;
      const double decay = options_.hop_decay;
      plan.push_back({SearchStrategy::Dependency, [index, graph, reversed, query, max_hops, decay]() {
                        return run_dependency_signal(index, graph, reversed, query, max_hops,
                                                     decay);
                      }});
    }
  }

  std::vector<std::pair<SearchStrategy, SignalScores>> completed;
  if (!query.timeout) {
    for (auto& signal : plan) {
      try {
        completed.emplace_back(signal.strategy, signal.run());
      } catch (const StoreClosedError&) {
        throw;
      } catch (const DimensionMismatchError&) {
        throw;
      } catch (const std::exception& e) {
        std::cerr << "Warning: [HybridSearch] " << to_string(signal.strategy)
                  << " signal failed: " << e.what() << std::endl;
      }
    }
  } else {
    const auto deadline = start + *query.timeout;
    std::vector<std::pair<SearchStrategy, std::future<SignalScores>>> pending;
    for (auto& signal : plan) {
      // A signal still queued at the deadline is skipped rather than started late
      std::function<SignalScores()> task = [deadline, run = std::move(signal.run)]() {
        if (std::chrono::steady_clock::now() >= deadline) {
          return SignalScores{};
        }
        return run();
      };
      pending.emplace_back(signal.strategy, signal_pool_->submit(std::move(task)));
    }
    for (auto& [strategy, future] : pending) {
      if (future.wait_until(deadline) != std::future_status::ready) {
        std::cerr << "Warning: [HybridSearch] " << to_string(strategy)
                  << " signal timed out; returning partial results" << std::endl;
        continue;
      }
      try {
        completed.emplace_back(strategy, future.get());
      } catch (const StoreClosedError&) {
        throw;
      } catch (const DimensionMismatchError&) {
        throw;
      } catch (const std::exception& e) {
        std::cerr << "Warning: [HybridSearch] " << to_string(strategy)
                  << " signal failed: " << e.what() << std::endl;
      }
    }
  }

  // Signals are merged in plan order so sums and matched_by are reproducible
  std::unordered_map<std::string, SearchResult> merged;
  for (auto& [strategy, scores] : completed) {
    const double w = weight_for(weights, strategy);
    for (auto& [id, hit] : scores) {
      auto [it, inserted] = merged.try_emplace(id);
      SearchResult& result = it->second;
      if (inserted) {
        result.chunk = std::move(hit.chunk);
        result.weights = weights;
      }
      switch (strategy) {
        case SearchStrategy::Vector:
          result.breakdown.vector = hit.score;
          break;
        case SearchStrategy::Keyword:
          result.breakdown.keyword = hit.score;
          break;
        case SearchStrategy::Dependency:
          result.breakdown.dependency = hit.score;
          break;
      }
      result.score += w * hit.score;
      result.matched_by.push_back(strategy);
    }
  }

  std::vector<SearchResult> results;
  results.reserve(merged.size());
  for (auto& entry : merged) {
    results.push_back(std::move(entry.second));
  }
  std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
    if (a.score != b.score)
      return a.score > b.score;
    return a.chunk.id < b.chunk.id;
  });
  if (top_k <= 0) {
    results.clear();
  } else if (results.size() > static_cast<size_t>(top_k)) {
    results.resize(static_cast<size_t>(top_k));
  }

  const double latency_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  record_search(results, latency_ms);
  return results;
}

void HybridSearchEngine::record_search(const std::vector<SearchResult>& results,
                                       double latency_ms) {
  bool vector = false;
  bool keyword = false;
  bool dependency = false;
  for (const auto& result : results) {
    for (auto strategy : result.matched_by) {
      vector |= strategy == SearchStrategy::Vector;
      keyword |= strategy == SearchStrategy::Keyword;
      dependency |= strategy == SearchStrategy::Dependency;
    }
  }

  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.total_searches++;
  stats_.average_latency_ms +=
      (latency_ms - stats_.average_latency_ms) / static_cast<double>(stats_.total_searches);
  if (vector)
    stats_.vector_hits++;
  if (keyword)
    stats_.keyword_hits++;
  if (dependency)
    stats_.dependency_hits++;
}

SearchStats HybridSearchEngine::get_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void HybridSearchEngine::reset_stats() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_ = SearchStats{};
}

std::string HybridSearchEngine::explain_search(const std::vector<SearchResult>& results) const {
  if (results.empty()) {
    return "No results";
  }

  std::ostringstream out;
  out << std::fixed << std::setprecision(4);
  out << "Search explanation (" << results.size() << " results)\n";
  for (size_t i = 0; i < results.size(); ++i) {
    const SearchResult& r = results[i];
    out << "#" << (i + 1) << " " << r.chunk.id << " (" << r.chunk.file_path;
    if (!r.chunk.name.empty()) {
      out << ":" << r.chunk.name;
    }
    out << ") score=" << r.score << "\n";
    if (r.breakdown.vector) {
      out << "    vector     " << *r.breakdown.vector << " x " << r.weights.vector << "\n";
    }
    if (r.breakdown.keyword) {
      out << "    keyword    " << *r.breakdown.keyword << " x " << r.weights.keyword << "\n";
    }
    if (r.breakdown.dependency) {
      out << "    dependency " << *r.breakdown.dependency << " x " << r.weights.dependency
          << "\n";
    }
    out << "    matched by: ";
    for (size_t j = 0; j < r.matched_by.size(); ++j) {
      if (j > 0)
        out << ", ";
      out << to_string(r.matched_by[j]);
    }
    out << "\n";
  }
  return out.str();
}

}  // namespace codelens_core
