#include "codelens_core/indexing/index_metadata.hpp"

#include <fstream>
#include <iostream>

#include "codelens_core/utils/atomic_file.hpp"

namespace codelens_core {

void to_json(nlohmann::json& j, const IndexMetadata& metadata) {
  nlohmann::json hashes = nlohmann::json::array();
  for (const auto& [path, hash] : metadata.file_hashes) {
    hashes.push_back({path, hash});
  }
  j = nlohmann::json{{"version", metadata.version},
                     {"lastIndexedAt", metadata.last_indexed_at},
                     {"fileHashes", hashes},
                     {"projectPath", metadata.project_path}};
}

void from_json(const nlohmann::json& j, IndexMetadata& metadata) {
  metadata.version = j.at("version").get<std::string>();
  metadata.last_indexed_at = j.at("lastIndexedAt").get<int64_t>();
  metadata.project_path = j.value("projectPath", std::string());
  metadata.file_hashes.clear();
  for (const auto& pair : j.at("fileHashes")) {
    metadata.file_hashes[pair.at(0).get<std::string>()] = pair.at(1).get<std::string>();
  }
}

std::optional<IndexMetadata> load_index_metadata(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }

  std::ifstream file_stream(path);
  if (!file_stream.is_open()) {
    std::cerr << "Warning: could not open index metadata " << path.string() << std::endl;
    return std::nullopt;
  }

  try {
    nlohmann::json j;
    file_stream >> j;
    return j.get<IndexMetadata>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Warning: ignoring malformed index metadata " << path.string() << ": "
              << e.what() << std::endl;
    return std::nullopt;
  }
}

void save_index_metadata(const std::filesystem::path& path, const IndexMetadata& metadata) {
  try {
    write_file_atomically(path, nlohmann::json(metadata).dump(2));
  } catch (const std::exception& e) {
    throw IndexerError("Failed to save index metadata: " + std::string(e.what()));
  }
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace codelens_core
