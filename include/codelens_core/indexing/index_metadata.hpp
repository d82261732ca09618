#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace codelens_core {

class IndexerError : public std::exception {
 public:
  explicit IndexerError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// What the index currently reflects. Saved wholesale, never merged.
struct IndexMetadata {
  static constexpr const char* CURRENT_VERSION = "1.0.0";

  std::string version = CURRENT_VERSION;
  int64_t last_indexed_at = 0;  // ms since epoch
  std::map<std::string, std::string> file_hashes;  // project-relative path -> sha256
  std::string project_path;
};

// {"version", "lastIndexedAt", "fileHashes": [[path, hash], ...], "projectPath"}
void to_json(nlohmann::json& j, const IndexMetadata& metadata);
void from_json(const nlohmann::json& j, IndexMetadata& metadata);

// Missing file yields nullopt; an unreadable or malformed file is logged and yields nullopt
std::optional<IndexMetadata> load_index_metadata(const std::filesystem::path& path);

// Writes a sibling temp file and renames it over path; throws IndexerError
void save_index_metadata(const std::filesystem::path& path, const IndexMetadata& metadata);

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);

}  // namespace codelens_core
