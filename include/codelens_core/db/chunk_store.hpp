#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "codelens_core/db/database_manager.hpp"
#include "codelens_core/types/chunk.hpp"
#include "codelens_core/types/chunk_filter.hpp"

namespace codelens_core {

enum class SimilarityMetric { Cosine, InnerProduct };

std::string to_string(SimilarityMetric metric);
SimilarityMetric similarity_metric_from_string(const std::string& str);

class ChunkStoreError : public std::exception {
 public:
  explicit ChunkStoreError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The storage directory or database cannot be opened or written.
class StorageUnavailableError : public ChunkStoreError {
 public:
  using ChunkStoreError::ChunkStoreError;
};

class StoreClosedError : public ChunkStoreError {
 public:
  using ChunkStoreError::ChunkStoreError;
};

// Raised after the valid part of a batch has been committed; carries the rejected ids.
class DimensionMismatchError : public ChunkStoreError {
 public:
  DimensionMismatchError(const std::string& message,
                         size_t expected_dimension,
                         std::vector<std::string> rejected_ids)
      : ChunkStoreError(message),
        expected_dimension_(expected_dimension),
        rejected_ids_(std::move(rejected_ids)) {}

  size_t expected_dimension() const { return expected_dimension_; }
  const std::vector<std::string>& rejected_ids() const { return rejected_ids_; }

 private:
  size_t expected_dimension_;
  std::vector<std::string> rejected_ids_;
};

struct ChunkStoreOptions {
  std::filesystem::path storage_path;
  size_t dimension = 1536;
  SimilarityMetric metric = SimilarityMetric::Cosine;
  int pool_size = 4;
};

struct ChunkMatch {
  CodeChunk chunk;
  // Cosine similarity in [-1, 1], or the raw inner product
  float similarity = 0.0f;
};

struct ChunkStoreStats {
  size_t total_chunks = 0;
  size_t total_files = 0;
  size_t dimension = 0;
  uint64_t disk_bytes = 0;
};

/**
 * Durable chunk storage. SQLite holds the records (content encoded by CompressionService),
 * and an in-memory faiss index keyed by each row's insertion sequence answers similarity queries.
 * The index is rebuilt from SQLite on initialize().
 */
class ChunkStore {
 public:
  static constexpr const char* DATABASE_FILE_NAME = "chunks.db";

  explicit ChunkStore(ChunkStoreOptions options);
  ~ChunkStore();

  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;
  ChunkStore(ChunkStore&&) = delete;
  ChunkStore& operator=(ChunkStore&&) = delete;

  // Opens the backing storage; throws StorageUnavailableError
  void initialize();

  // Upserts by id. Chunks with the wrong embedding length are skipped and reported via
  // DimensionMismatchError once the rest of the batch is committed.
  void insert_chunks(const std::vector<CodeChunk>& chunks);

  std::vector<ChunkMatch> search(const std::vector<float>& query_embedding,
                                 size_t k,
                                 const ChunkFilter& filter = {}) const;

  // Replaces every chunk of file_path with the given chunks in one transaction
  void update_file(const std::string& file_path, const std::vector<CodeChunk>& chunks);
  size_t delete_file(const std::string& file_path);
  size_t delete_chunks(const std::vector<std::string>& ids);

  std::optional<CodeChunk> get_chunk(const std::string& id) const;
  // In insertion order
  std::vector<CodeChunk> get_all_chunks() const;

  ChunkStoreStats get_stats() const;
  void clear();
  void close();

  bool is_open() const;
  size_t dimension() const { return options_.dimension; }
  SimilarityMetric metric() const { return options_.metric; }
  std::filesystem::path database_path() const {
    return options_.storage_path / DATABASE_FILE_NAME;
  }

 private:
  enum class State { Created, Open, Closed };

  // What the index needs to filter a hit without touching SQLite
  struct IndexedChunk {
    std::string id;
    std::string file_path;
    ChunkKind kind = ChunkKind::Other;
    int complexity = 0;
  };

  struct WrittenRow {
    int64_t seq;
    const CodeChunk* chunk;
  };

  void ensure_open() const;
  std::vector<WrittenRow> upsert_rows(sqlite::database& db,
                                      const std::vector<const CodeChunk*>& chunks);
  void apply_index_changes(const std::vector<int64_t>& removed,
                           const std::vector<WrittenRow>& written);
  void rebuild_index();
  std::unique_ptr<faiss::IndexIDMap> create_base_index() const;
  std::vector<CodeChunk> fetch_by_seq(const std::vector<int64_t>& seqs) const;
  [[noreturn]] void throw_dimension_mismatch(std::vector<std::string> rejected) const;

  ChunkStoreOptions options_;
  mutable DatabaseManager db_manager_;
  mutable std::shared_mutex mutex_;
  State state_ = State::Created;
  std::unique_ptr<faiss::IndexIDMap> index_;
  std::unordered_map<int64_t, IndexedChunk> indexed_;
};

}  // namespace codelens_core
