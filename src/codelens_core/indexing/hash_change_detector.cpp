#include "codelens_core/indexing/hash_change_detector.hpp"

#include <iostream>
#include <set>

#include "codelens_core/services/hash_service.hpp"

namespace codelens_core {

HashChangeDetector::HashChangeDetector(ProjectScanner scanner) : scanner_(std::move(scanner)) {}

std::vector<FileChangeInfo> HashChangeDetector::detect(const IndexMetadata& metadata) const {
  std::set<std::string> keys;
  for (auto& path : scanner_.scan()) {
    keys.insert(std::move(path));
  }
  for (const auto& entry : metadata.file_hashes) {
    keys.insert(entry.first);
  }

  const auto now = std::chrono::system_clock::now();
  std::vector<FileChangeInfo> changes;
  for (const auto& key : keys) {
    const auto known = metadata.file_hashes.find(key);
    const auto absolute = scanner_.to_absolute(key);

    std::error_code ec;
    if (!std::filesystem::exists(absolute, ec)) {
      if (known != metadata.file_hashes.end()) {
        changes.push_back({key, ChangeKind::Deleted, "", now, DetectorSource::Hash});
      }
      continue;
    }

    std::string hash;
    try {
      hash = HashService::sha256_file(absolute);
    } catch (const HashError& e) {
      std::cerr << "Warning: [Indexer] skipping unreadable file " << key << ": " << e.what()
                << std::endl;
      continue;
    }

    if (known == metadata.file_hashes.end()) {
      changes.push_back({key, ChangeKind::Added, hash, now, DetectorSource::Hash});
    } else if (known->second != hash) {
      changes.push_back({key, ChangeKind::Modified, hash, now, DetectorSource::Hash});
    }
  }
  return changes;
}

}  // namespace codelens_core
