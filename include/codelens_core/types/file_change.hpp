#pragma once

#include <chrono>
#include <string>

namespace codelens_core {

enum class ChangeKind { Added, Modified, Deleted };

// Detectors in merge priority order
enum class DetectorSource { Git, Hash, Timestamp };

std::string to_string(ChangeKind kind);
std::string to_string(DetectorSource source);

struct FileChangeInfo {
  std::string path;
  ChangeKind kind = ChangeKind::Modified;
  std::string hash;  // empty for deletions
  std::chrono::system_clock::time_point detected_at{};
  DetectorSource source = DetectorSource::Hash;
};

}  // namespace codelens_core
