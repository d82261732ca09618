#include "codelens_core/indexing/timestamp_change_detector.hpp"

namespace codelens_core {

TimestampChangeDetector::TimestampChangeDetector(ProjectScanner scanner)
    : scanner_(std::move(scanner)) {}

std::chrono::system_clock::duration TimestampChangeDetector::file_clock_offset() {
  using file_clock = std::filesystem::file_time_type::clock;
  // Bracket the system reading so the error is half the gap between file clock reads
  const auto file_before = file_clock::now();
  const auto system_now = std::chrono::system_clock::now();
  const auto file_after = file_clock::now();
  const auto file_mid = file_before + (file_after - file_before) / 2;
  return std::chrono::duration_cast<std::chrono::system_clock::duration>(
      system_now.time_since_epoch() - file_mid.time_since_epoch());
}

std::chrono::system_clock::time_point TimestampChangeDetector::to_system_time(
    std::filesystem::file_time_type ftime, std::chrono::system_clock::duration offset) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(ftime.time_since_epoch()) +
      offset);
}

std::vector<FileChangeInfo> TimestampChangeDetector::detect(const IndexMetadata& metadata) const {
  const auto now = std::chrono::system_clock::now();
  const auto offset = file_clock_offset();
  std::vector<FileChangeInfo> changes;
  for (const auto& entry : metadata.file_hashes) {
    const std::string& key = entry.first;
    std::error_code ec;
    auto ftime = std::filesystem::last_write_time(scanner_.to_absolute(key), ec);
    if (ec) {
      changes.push_back({key, ChangeKind::Deleted, "", now, DetectorSource::Timestamp});
      continue;
    }
    if (to_epoch_ms(to_system_time(ftime, offset)) > metadata.last_indexed_at) {
      changes.push_back({key, ChangeKind::Modified, "", now, DetectorSource::Timestamp});
    }
  }
  return changes;
}

}  // namespace codelens_core
