#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "codelens_core/indexing/change_detector.hpp"
#include "codelens_core/indexing/index_metadata.hpp"
#include "codelens_core/indexing/project_scanner.hpp"
#include "codelens_core/search/dependency_graph.hpp"
#include "codelens_core/types/file_change.hpp"

namespace codelens_core {

enum class IndexStrategy { Full, Incremental };
std::string to_string(IndexStrategy strategy);

struct IndexerOptions {
  ScanOptions scan;
  // Defaults to <root>/.codelens/index-metadata.json
  std::optional<std::filesystem::path> metadata_path;
  bool enable_git = true;
  bool enable_hash = true;
  bool enable_timestamp = true;
};

struct ChangeDetectionResult {
  IndexStrategy strategy = IndexStrategy::Full;
  std::vector<FileChangeInfo> changed_files;
  // -1 means reindex everything
  int64_t total_files_to_reindex = -1;
  std::chrono::milliseconds elapsed{0};
  std::vector<std::string> detectors_used;
};

/**
 * Decides per cycle between a full and an incremental reindex.
 *
 * The metadata file is a single-writer resource: every indexer pointed at the same file
 * in this process shares one mutex, held by detect_changes, save_metadata and
 * clear_metadata. Writes go through a temp file and rename.
 */
class IncrementalIndexer {
 public:
  explicit IncrementalIndexer(IndexerOptions options);
  // Detectors are merged by DetectorSource priority (git, hash, timestamp)
  IncrementalIndexer(IndexerOptions options, std::vector<std::unique_ptr<ChangeDetector>> detectors);

  ChangeDetectionResult detect_changes();

  // Files that transitively depend on any changed file, excluding the changed files
  std::vector<std::string> calculate_affected_files(const std::vector<std::string>& changed_files,
                                                    const DependencyGraph& graph) const;

  // Hashes files and replaces the metadata; returns how many files were recorded
  size_t save_metadata(const std::vector<std::filesystem::path>& files);
  void clear_metadata();

  std::optional<IndexMetadata> load_metadata() const;
  std::vector<std::string> scan_project_files() const;

  const std::filesystem::path& metadata_path() const { return metadata_path_; }

 private:
  ProjectScanner scanner_;
  std::filesystem::path metadata_path_;
  std::vector<std::unique_ptr<ChangeDetector>> detectors_;
  std::shared_ptr<std::mutex> metadata_mutex_;
};

}  // namespace codelens_core
