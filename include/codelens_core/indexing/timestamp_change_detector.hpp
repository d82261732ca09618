#pragma once

#include "codelens_core/indexing/change_detector.hpp"
#include "codelens_core/indexing/project_scanner.hpp"

namespace codelens_core {

// Tracked files written after lastIndexedAt are modified; vanished ones are deleted.
class TimestampChangeDetector : public ChangeDetector {
 public:
  explicit TimestampChangeDetector(ProjectScanner scanner);

  DetectorSource source() const override { return DetectorSource::Timestamp; }
  std::vector<FileChangeInfo> detect(const IndexMetadata& metadata) const override;

  // file_time_type has no portable conversion in C++17. The offset is sampled once per
  // detect() so every file is converted against the same reference.
  static std::chrono::system_clock::duration file_clock_offset();
  static std::chrono::system_clock::time_point to_system_time(
      std::filesystem::file_time_type ftime, std::chrono::system_clock::duration offset);

 private:
  ProjectScanner scanner_;
};

}  // namespace codelens_core
