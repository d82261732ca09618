#include "codelens_core/indexing/incremental_indexer.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include "codelens_core/indexing/git_change_detector.hpp"
#include "codelens_core/indexing/hash_change_detector.hpp"
#include "codelens_core/indexing/timestamp_change_detector.hpp"
#include "codelens_core/services/hash_service.hpp"

namespace codelens_core {

namespace {

// One mutex per metadata file for the whole process
std::shared_ptr<std::mutex> metadata_mutex_for(const std::filesystem::path& path) {
  static std::mutex registry_mutex;
  static std::unordered_map<std::string, std::weak_ptr<std::mutex>> registry;

  std::error_code ec;
  std::filesystem::path canonical = std::filesystem::weakly_canonical(path, ec);
  const std::string key = ec ? path.lexically_normal().string() : canonical.string();

  std::lock_guard<std::mutex> lock(registry_mutex);
  auto& slot = registry[key];
  auto mutex = slot.lock();
  if (!mutex) {
    mutex = std::make_shared<std::mutex>();
    slot = mutex;
  }
  return mutex;
}

}  // namespace

std::string to_string(IndexStrategy strategy) {
  switch (strategy) {
    case IndexStrategy::Full:
      return "full";
    case IndexStrategy::Incremental:
      return "incremental";
    default:
      return "unknown";
  }
}

IncrementalIndexer::IncrementalIndexer(IndexerOptions options)
    : IncrementalIndexer(options, {}) {
  ProjectScanner scanner(options.scan);
  if (options.enable_git) {
    detectors_.push_back(std::make_unique<GitChangeDetector>(scanner));
  }
  if (options.enable_hash) {
    detectors_.push_back(std::make_unique<HashChangeDetector>(scanner));
  }
  if (options.enable_timestamp) {
    detectors_.push_back(std::make_unique<TimestampChangeDetector>(scanner));
  }
}

IncrementalIndexer::IncrementalIndexer(IndexerOptions options,
                                       std::vector<std::unique_ptr<ChangeDetector>> detectors)
    : scanner_(options.scan), detectors_(std::move(detectors)) {
  metadata_path_ = options.metadata_path.value_or(scanner_.root() / ".codelens" /
                                                  "index-metadata.json");
  metadata_mutex_ = metadata_mutex_for(metadata_path_);
  std::stable_sort(detectors_.begin(), detectors_.end(),
                   [](const std::unique_ptr<ChangeDetector>& a,
                      const std::unique_ptr<ChangeDetector>& b) {
                     return static_cast<int>(a->source()) < static_cast<int>(b->source());
                   });
}

ChangeDetectionResult IncrementalIndexer::detect_changes() {
  const auto start = std::chrono::steady_clock::now();
  auto elapsed = [&start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
  };

  std::lock_guard<std::mutex> lock(*metadata_mutex_);

  ChangeDetectionResult result;
  std::optional<IndexMetadata> metadata = load_index_metadata(metadata_path_);
  if (!metadata) {
    std::cout << "[Indexer] No index metadata at " << metadata_path_.string()
              << ", full reindex required" << std::endl;
    result.strategy = IndexStrategy::Full;
    result.total_files_to_reindex = -1;
    result.elapsed = elapsed();
    return result;
  }

  using DetectorOutput = std::optional<std::vector<FileChangeInfo>>;
  std::vector<std::future<DetectorOutput>> runs;
  runs.reserve(detectors_.size());
  const IndexMetadata& snapshot = *metadata;
  for (const auto& detector : detectors_) {
    const ChangeDetector* d = detector.get();
    runs.push_back(std::async(std::launch::async, [d, &snapshot]() -> DetectorOutput {
      if (!d->is_available()) {
        return std::nullopt;
      }
      return d->detect(snapshot);
    }));
  }

  // Merge in priority order regardless of completion order; first detector wins per path
  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < runs.size(); ++i) {
    const std::string name = detectors_[i]->name();
    DetectorOutput output;
    try {
      output = runs[i].get();
    } catch (const std::exception& e) {
      std::cerr << "Warning: [Indexer] " << name << " detector failed: " << e.what() << std::endl;
      continue;
    }
    if (!output) {
      std::cout << "[Indexer] " << name << " detector unavailable, skipping" << std::endl;
      continue;
    }
    result.detectors_used.push_back(name);
    for (auto& change : *output) {
      if (seen.insert(change.path).second) {
        result.changed_files.push_back(std::move(change));
      }
    }
  }

  for (auto& change : result.changed_files) {
    if (change.kind == ChangeKind::Deleted || !change.hash.empty())
      continue;
    try {
      change.hash = HashService::sha256_file(scanner_.to_absolute(change.path));
    } catch (const HashError& e) {
      std::cerr << "Warning: [Indexer] could not hash " << change.path << ": " << e.what()
                << std::endl;
    }
  }

  std::sort(result.changed_files.begin(), result.changed_files.end(),
            [](const FileChangeInfo& a, const FileChangeInfo& b) { return a.path < b.path; });

  result.strategy = IndexStrategy::Incremental;
  result.total_files_to_reindex = static_cast<int64_t>(result.changed_files.size());
  result.elapsed = elapsed();
  std::cout << "[Indexer] Detected " << result.changed_files.size() << " changed files in "
            << result.elapsed.count() << "ms" << std::endl;
  return result;
}

std::vector<std::string> IncrementalIndexer::calculate_affected_files(
    const std::vector<std::string>& changed_files, const DependencyGraph& graph) const {
  return transitive_dependents(graph, changed_files);
}

size_t IncrementalIndexer::save_metadata(const std::vector<std::filesystem::path>& files) {
  std::lock_guard<std::mutex> lock(*metadata_mutex_);

  IndexMetadata metadata;
  metadata.project_path = scanner_.root().string();
  // Taken before hashing so writes racing the save still look newer
  metadata.last_indexed_at = to_epoch_ms(std::chrono::system_clock::now());

  for (const auto& file : files) {
    const std::string key = scanner_.to_key(file);
    try {
      metadata.file_hashes[key] = HashService::sha256_file(scanner_.to_absolute(key));
    } catch (const HashError& e) {
      std::cerr << "Warning: [Indexer] skipping " << key << " in metadata: " << e.what()
                << std::endl;
    }
  }

  save_index_metadata(metadata_path_, metadata);
  std::cout << "[Indexer] Saved metadata for " << metadata.file_hashes.size() << " files to "
            << metadata_path_.string() << std::endl;
  return metadata.file_hashes.size();
}

void IncrementalIndexer::clear_metadata() {
  std::lock_guard<std::mutex> lock(*metadata_mutex_);
  std::error_code ec;
  std::filesystem::remove(metadata_path_, ec);
  if (ec) {
    throw IndexerError("Failed to clear index metadata " + metadata_path_.string() + ": " +
                       ec.message());
  }
}

std::optional<IndexMetadata> IncrementalIndexer::load_metadata() const {
  std::lock_guard<std::mutex> lock(*metadata_mutex_);
  return load_index_metadata(metadata_path_);
}

std::vector<std::string> IncrementalIndexer::scan_project_files() const {
  return scanner_.scan();
}

}  // namespace codelens_core
