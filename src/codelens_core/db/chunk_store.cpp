#include "codelens_core/db/chunk_store.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "codelens_core/db/pooled_connection.hpp"
#include "codelens_core/db/sqlite_error_utils.hpp"
#include "codelens_core/db/transaction.hpp"
#include "codelens_core/services/compression_service.hpp"

namespace codelens_core {

namespace {

[[noreturn]] void throw_store_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  if (is_storage_failure(e.get_code())) {
    throw StorageUnavailableError(format_db_error(operation, e));
  }
  throw ChunkStoreError(format_db_error(operation, e));
}

std::string now_as_string() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::vector<char> vector_to_blob(const std::vector<float>& vec) {
  std::vector<char> blob(vec.size() * sizeof(float));
  std::memcpy(blob.data(), vec.data(), blob.size());
  return blob;
}

std::string int_vector_to_comma_string(const std::vector<int64_t>& values) {
  std::stringstream ss;
  for (size_t i = 0; i < values.size(); ++i) {
    ss << values[i];
    if (i < values.size() - 1)
      ss << ",";
  }
  return ss.str();
}

std::string dependencies_to_json(const std::vector<std::string>& deps) {
  return nlohmann::json(deps).dump();
}

std::vector<std::string> dependencies_from_json(const std::optional<std::string>& text) {
  if (!text || text->empty()) {
    return {};
  }
  nlohmann::json parsed = nlohmann::json::parse(*text, nullptr, /*allow_exceptions*/ false);
  if (!parsed.is_array()) {
    return {};
  }
  std::vector<std::string> deps;
  for (const auto& item : parsed) {
    if (item.is_string()) {
      deps.push_back(item.get<std::string>());
    }
  }
  return deps;
}

constexpr const char* SELECT_CHUNK_COLUMNS =
    "SELECT seq, id, file_path, name, kind, content, loc, complexity, dependencies, vector_blob "
    "FROM chunks";

CodeChunk make_chunk(std::string id,
                     std::string file_path,
                     std::string name,
                     const std::string& kind,
                     const std::vector<char>& content,
                     int loc,
                     int complexity,
                     const std::optional<std::string>& dependencies,
                     const std::vector<char>& vector_blob) {
  CodeChunk chunk;
  chunk.id = std::move(id);
  chunk.file_path = std::move(file_path);
  chunk.name = std::move(name);
  chunk.kind = chunk_kind_from_string(kind);
  chunk.content = CompressionService::decode(content);
  chunk.loc = loc;
  chunk.complexity = complexity;
  chunk.dependencies = dependencies_from_json(dependencies);
  const float* data = reinterpret_cast<const float*>(vector_blob.data());
  chunk.embedding.assign(data, data + vector_blob.size() / sizeof(float));
  return chunk;
}

}  // namespace

std::string to_string(SimilarityMetric metric) {
  switch (metric) {
    case SimilarityMetric::Cosine:
      return "cosine";
    case SimilarityMetric::InnerProduct:
      return "inner_product";
    default:
      return "unknown";
  }
}

SimilarityMetric similarity_metric_from_string(const std::string& str) {
  if (str == "cosine")
    return SimilarityMetric::Cosine;
  if (str == "inner_product" || str == "dot")
    return SimilarityMetric::InnerProduct;
  throw std::invalid_argument("Unknown SimilarityMetric: " + str);
}

ChunkStore::ChunkStore(ChunkStoreOptions options) : options_(std::move(options)) {
  if (options_.dimension == 0) {
    throw std::invalid_argument("ChunkStore dimension must be greater than 0");
  }
  if (options_.pool_size <= 0) {
    throw std::invalid_argument("ChunkStore pool_size must be greater than 0");
  }
}

ChunkStore::~ChunkStore() {
  close();
}

void ChunkStore::initialize() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (state_ == State::Open) {
    return;
  }
  if (state_ == State::Closed) {
    throw StoreClosedError("ChunkStore has been closed and cannot be reopened");
  }

  try {
    std::filesystem::create_directories(options_.storage_path);
    db_manager_.initialize(database_path(), options_.pool_size);
  } catch (const sqlite::sqlite_exception& e) {
    throw StorageUnavailableError(format_db_error("initialize", e));
  } catch (const std::filesystem::filesystem_error& e) {
    throw StorageUnavailableError("Storage path is not accessible: " + std::string(e.what()));
  } catch (const std::runtime_error& e) {
    throw StorageUnavailableError("Failed to open chunk database: " + std::string(e.what()));
  }

  rebuild_index();
  state_ = State::Open;
  std::cout << "[ChunkStore] Opened " << database_path().string() << " with "
            << index_->ntotal << " chunks (dim=" << options_.dimension
            << ", metric=" << to_string(options_.metric) << ")" << std::endl;
}

void ChunkStore::close() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (state_ == State::Closed) {
    return;
  }
  db_manager_.shutdown();
  index_.reset();
  indexed_.clear();
  state_ = State::Closed;
}

bool ChunkStore::is_open() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_ == State::Open;
}

void ChunkStore::ensure_open() const {
  if (state_ == State::Closed) {
    throw StoreClosedError("ChunkStore is closed");
  }
  if (state_ != State::Open) {
    throw ChunkStoreError("ChunkStore has not been initialized");
  }
}

void ChunkStore::insert_chunks(const std::vector<CodeChunk>& chunks) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ensure_open();

  std::vector<const CodeChunk*> valid;
  std::vector<std::string> rejected;
  for (const auto& chunk : chunks) {
    if (chunk.embedding.size() == options_.dimension) {
      valid.push_back(&chunk);
    } else {
      rejected.push_back(chunk.id);
    }
  }

  if (!valid.empty()) {
    std::vector<WrittenRow> written;
    try {
      PooledConnection conn(db_manager_);
      Transaction tx(*conn);
      written = upsert_rows(*conn, valid);
      tx.commit();
    } catch (const sqlite::sqlite_exception& e) {
      throw_store_error("insert_chunks", e);
    }
    apply_index_changes({}, written);
  }

  if (!rejected.empty()) {
    throw_dimension_mismatch(std::move(rejected));
  }
}

void ChunkStore::update_file(const std::string& file_path, const std::vector<CodeChunk>& chunks) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ensure_open();

  std::vector<const CodeChunk*> valid;
  std::vector<std::string> rejected;
  for (const auto& chunk : chunks) {
    if (chunk.embedding.size() == options_.dimension) {
      valid.push_back(&chunk);
    } else {
      rejected.push_back(chunk.id);
    }
  }

  std::vector<int64_t> removed;
  std::vector<WrittenRow> written;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn);
    *conn << "SELECT seq FROM chunks WHERE file_path = ?" << file_path >>
        [&](int64_t seq) { removed.push_back(seq); };
    *conn << "DELETE FROM chunks WHERE file_path = ?" << file_path;
    written = upsert_rows(*conn, valid);
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("update_file", e);
  }
  apply_index_changes(removed, written);

  if (!rejected.empty()) {
    throw_dimension_mismatch(std::move(rejected));
  }
}

size_t ChunkStore::delete_file(const std::string& file_path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ensure_open();

  std::vector<int64_t> removed;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn);
    *conn << "SELECT seq FROM chunks WHERE file_path = ?" << file_path >>
        [&](int64_t seq) { removed.push_back(seq); };
    *conn << "DELETE FROM chunks WHERE file_path = ?" << file_path;
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("delete_file", e);
  }
  apply_index_changes(removed, {});
  return removed.size();
}

size_t ChunkStore::delete_chunks(const std::vector<std::string>& ids) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ensure_open();
  if (ids.empty()) {
    return 0;
  }

  std::vector<int64_t> removed;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn);
    for (const auto& id : ids) {
      *conn << "SELECT seq FROM chunks WHERE id = ?" << id >>
          [&](int64_t seq) { removed.push_back(seq); };
      *conn << "DELETE FROM chunks WHERE id = ?" << id;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("delete_chunks", e);
  }
  apply_index_changes(removed, {});
  return removed.size();
}

void ChunkStore::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ensure_open();
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunks;";
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("clear", e);
  }
  index_ = create_base_index();
  indexed_.clear();
}

std::vector<ChunkStore::WrittenRow> ChunkStore::upsert_rows(
    sqlite::database& db, const std::vector<const CodeChunk*>& chunks) {
  const std::string updated_at = now_as_string();
  // Later duplicates of an id win, matching the SQL upsert order
  std::map<int64_t, const CodeChunk*> by_seq;
  for (const CodeChunk* chunk : chunks) {
    std::vector<char> content = CompressionService::encode(chunk->content);
    std::vector<char> vector_blob = vector_to_blob(chunk->embedding);
    db << "INSERT INTO chunks (id, file_path, name, kind, content, loc, complexity, "
          "dependencies, vector_blob, updated_at) VALUES (?,?,?,?,?,?,?,?,?,?) "
          "ON CONFLICT(id) DO UPDATE SET file_path=excluded.file_path, name=excluded.name, "
          "kind=excluded.kind, content=excluded.content, loc=excluded.loc, "
          "complexity=excluded.complexity, dependencies=excluded.dependencies, "
          "vector_blob=excluded.vector_blob, updated_at=excluded.updated_at"
       << chunk->id << chunk->file_path << chunk->name << to_string(chunk->kind) << content
       << chunk->loc << chunk->complexity << dependencies_to_json(chunk->dependencies)
       << vector_blob << updated_at;

    int64_t seq = -1;
    db << "SELECT seq FROM chunks WHERE id = ?" << chunk->id >> seq;
    by_seq[seq] = chunk;
  }

  std::vector<WrittenRow> rows;
  rows.reserve(by_seq.size());
  for (const auto& [seq, chunk] : by_seq) {
    rows.push_back({seq, chunk});
  }
  return rows;
}

void ChunkStore::apply_index_changes(const std::vector<int64_t>& removed,
                                     const std::vector<WrittenRow>& written) {
  std::vector<faiss::idx_t> stale(removed.begin(), removed.end());
  for (const auto& row : written) {
    stale.push_back(row.seq);
  }

  try {
    if (!stale.empty()) {
      faiss::IDSelectorBatch selector(stale.size(), stale.data());
      index_->remove_ids(selector);
      for (auto seq : removed) {
        indexed_.erase(seq);
      }
    }

    if (!written.empty()) {
      std::vector<faiss::idx_t> labels;
      std::vector<float> flat;
      labels.reserve(written.size());
      flat.reserve(written.size() * options_.dimension);
      for (const auto& row : written) {
        labels.push_back(row.seq);
        flat.insert(flat.end(), row.chunk->embedding.begin(), row.chunk->embedding.end());
        indexed_[row.seq] = {row.chunk->id, row.chunk->file_path, row.chunk->kind,
                             row.chunk->complexity};
      }
      if (options_.metric == SimilarityMetric::Cosine) {
        faiss::fvec_renorm_L2(options_.dimension, labels.size(), flat.data());
      }
      index_->add_with_ids(static_cast<faiss::idx_t>(labels.size()), flat.data(), labels.data());
    }
  } catch (const faiss::FaissException& e) {
    // SQLite already holds the committed rows, so the index can be recovered from it
    std::cerr << "Warning: vector index update failed, rebuilding from storage: " << e.what()
              << std::endl;
    rebuild_index();
  }
}

void ChunkStore::rebuild_index() {
  index_ = create_base_index();
  indexed_.clear();

  try {
    std::vector<faiss::idx_t> labels;
    std::vector<float> flat;
    const size_t expected_bytes = options_.dimension * sizeof(float);

    {
      PooledConnection conn(db_manager_);
      *conn << "SELECT seq, id, file_path, kind, complexity, vector_blob FROM chunks ORDER BY seq" >>
          [&](int64_t seq, std::string id, std::string file_path, std::string kind,
              int complexity, std::vector<char> vector_blob) {
            if (vector_blob.size() != expected_bytes) {
              std::cerr << "Warning: Skipping chunk " << id
                        << " during index rebuild due to mismatched vector dimension. Expected "
                        << expected_bytes << " bytes, got " << vector_blob.size() << " bytes."
                        << std::endl;
              return;
            }
            labels.push_back(seq);
            const float* vec_ptr = reinterpret_cast<const float*>(vector_blob.data());
            flat.insert(flat.end(), vec_ptr, vec_ptr + options_.dimension);
            indexed_[seq] = {std::move(id), std::move(file_path), chunk_kind_from_string(kind),
                             complexity};
          };
    }

    if (!labels.empty()) {
      if (options_.metric == SimilarityMetric::Cosine) {
        faiss::fvec_renorm_L2(options_.dimension, labels.size(), flat.data());
      }
      index_->add_with_ids(static_cast<faiss::idx_t>(labels.size()), flat.data(), labels.data());
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("rebuild_index", e);
  } catch (const faiss::FaissException& e) {
    throw ChunkStoreError("Failed to rebuild vector index: " + std::string(e.what()));
  }
}

std::unique_ptr<faiss::IndexIDMap> ChunkStore::create_base_index() const {
  // Exact search: ranking must be reproducible and entries removable
  auto* base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(options_.dimension));
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;
  return index;
}

std::vector<ChunkMatch> ChunkStore::search(const std::vector<float>& query_embedding,
                                           size_t k,
                                           const ChunkFilter& filter) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ensure_open();

  if (query_embedding.size() != options_.dimension) {
    throw DimensionMismatchError("Query vector dimension mismatch. Expected " +
                                     std::to_string(options_.dimension) + ", got " +
                                     std::to_string(query_embedding.size()),
                                 options_.dimension, {});
  }
  if (k == 0 || index_->ntotal == 0) {
    return {};
  }

  std::vector<float> query = query_embedding;
  if (options_.metric == SimilarityMetric::Cosine) {
    faiss::fvec_renorm_L2(options_.dimension, 1, query.data());
  }

  // Score everything so filtering and the id tie-break see the full population
  const faiss::idx_t n = index_->ntotal;
  std::vector<float> distances(n);
  std::vector<faiss::idx_t> labels(n);
  try {
    index_->search(1, query.data(), n, distances.data(), labels.data());
  } catch (const faiss::FaissException& e) {
    throw ChunkStoreError("Vector search failed: " + std::string(e.what()));
  }

  struct Candidate {
    int64_t seq;
    const std::string* id;
    float score;
  };
  std::vector<Candidate> candidates;
  candidates.reserve(n);
  for (faiss::idx_t i = 0; i < n; ++i) {
    if (labels[i] == -1)
      continue;
    auto it = indexed_.find(labels[i]);
    if (it == indexed_.end()) {
      std::cerr << "Warning: vector index returned label " << labels[i]
                << " with no corresponding chunk." << std::endl;
      continue;
    }
    const IndexedChunk& meta = it->second;
    if (!filter.matches(meta.file_path, meta.kind, meta.complexity))
      continue;
    candidates.push_back({labels[i], &meta.id, distances[i]});
  }

  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.score != b.score)
      return a.score > b.score;
    return *a.id < *b.id;
  });
  if (candidates.size() > k) {
    candidates.resize(k);
  }
  if (candidates.empty()) {
    return {};
  }

  std::vector<int64_t> seqs;
  seqs.reserve(candidates.size());
  for (const auto& c : candidates) {
    seqs.push_back(c.seq);
  }
  std::vector<CodeChunk> chunks = fetch_by_seq(seqs);
  std::unordered_map<std::string, CodeChunk*> by_id;
  for (auto& chunk : chunks) {
    by_id[chunk.id] = &chunk;
  }

  std::vector<ChunkMatch> results;
  results.reserve(candidates.size());
  for (const auto& c : candidates) {
    auto it = by_id.find(*c.id);
    if (it == by_id.end()) {
      std::cerr << "Warning: chunk " << *c.id << " is indexed but missing from storage."
                << std::endl;
      continue;
    }
    results.push_back({std::move(*it->second), c.score});
  }
  return results;
}

std::vector<CodeChunk> ChunkStore::fetch_by_seq(const std::vector<int64_t>& seqs) const {
  std::vector<CodeChunk> chunks;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(SELECT_CHUNK_COLUMNS) + " WHERE seq IN (" +
                 int_vector_to_comma_string(seqs) + ")" >>
        [&](int64_t /*seq*/, std::string id, std::string file_path, std::string name,
            std::string kind, std::vector<char> content, int loc, int complexity,
            std::optional<std::string> dependencies, std::vector<char> vector_blob) {
          chunks.push_back(make_chunk(std::move(id), std::move(file_path), std::move(name), kind,
                                      content, loc, complexity, dependencies, vector_blob));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("fetch_chunks", e);
  }
  return chunks;
}

std::optional<CodeChunk> ChunkStore::get_chunk(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ensure_open();
  try {
    std::optional<CodeChunk> result;
    PooledConnection conn(db_manager_);
    *conn << std::string(SELECT_CHUNK_COLUMNS) + " WHERE id = ?" << id >>
        [&](int64_t /*seq*/, std::string chunk_id, std::string file_path, std::string name,
            std::string kind, std::vector<char> content, int loc, int complexity,
            std::optional<std::string> dependencies, std::vector<char> vector_blob) {
          result = make_chunk(std::move(chunk_id), std::move(file_path), std::move(name), kind,
                              content, loc, complexity, dependencies, vector_blob);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("get_chunk", e);
  }
}

std::vector<CodeChunk> ChunkStore::get_all_chunks() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ensure_open();
  std::vector<CodeChunk> chunks;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(SELECT_CHUNK_COLUMNS) + " ORDER BY seq" >>
        [&](int64_t /*seq*/, std::string id, std::string file_path, std::string name,
            std::string kind, std::vector<char> content, int loc, int complexity,
            std::optional<std::string> dependencies, std::vector<char> vector_blob) {
          chunks.push_back(make_chunk(std::move(id), std::move(file_path), std::move(name), kind,
                                      content, loc, complexity, dependencies, vector_blob));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("get_all_chunks", e);
  }
  return chunks;
}

ChunkStoreStats ChunkStore::get_stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ensure_open();

  ChunkStoreStats stats;
  stats.dimension = options_.dimension;
  try {
    PooledConnection conn(db_manager_);
    int64_t total = 0;
    int64_t files = 0;
    *conn << "SELECT COUNT(*), COUNT(DISTINCT file_path) FROM chunks" >>
        [&](int64_t t, int64_t f) {
          total = t;
          files = f;
        };
    stats.total_chunks = static_cast<size_t>(total);
    stats.total_files = static_cast<size_t>(files);
  } catch (const sqlite::sqlite_exception& e) {
    throw_store_error("get_stats", e);
  }

  const std::string db_file = database_path().string();
  for (const std::string& path : {db_file, db_file + "-wal", db_file + "-shm"}) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
      stats.disk_bytes += size;
    }
  }
  return stats;
}

void ChunkStore::throw_dimension_mismatch(std::vector<std::string> rejected) const {
  std::stringstream ss;
  ss << "Rejected " << rejected.size() << " chunk(s) with embedding length != "
     << options_.dimension << ":";
  for (const auto& id : rejected) {
    ss << " " << id;
  }
  throw DimensionMismatchError(ss.str(), options_.dimension, std::move(rejected));
}

}  // namespace codelens_core
