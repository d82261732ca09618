#include "codelens_core/indexing/git_change_detector.hpp"

#include <iostream>

#include "codelens_core/services/hash_service.hpp"
#include "codelens_core/utils/sub_process.hpp"

namespace codelens_core {

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

GitChangeDetector::GitChangeDetector(ProjectScanner scanner) : scanner_(std::move(scanner)) {}

bool GitChangeDetector::is_available() const {
  try {
    ProcessResult result = SubProcess::run("git -C " + SubProcess::quote(scanner_.root().string()) +
                                           " rev-parse --is-inside-work-tree");
    return result.success && trim(result.output) == "true";
  } catch (const std::runtime_error& e) {
    std::cerr << "Warning: [Indexer] could not run git: " << e.what() << std::endl;
    return false;
  }
}

std::optional<std::filesystem::path> GitChangeDetector::repository_root() const {
  ProcessResult result = SubProcess::run("git -C " + SubProcess::quote(scanner_.root().string()) +
                                         " rev-parse --show-toplevel");
  if (!result.success) {
    return std::nullopt;
  }
  std::string top = trim(result.output);
  if (top.empty()) {
    return std::nullopt;
  }
  return std::filesystem::path(top);
}

std::vector<GitChangeDetector::StatusEntry> GitChangeDetector::parse_porcelain(
    const std::string& output) {
  std::vector<std::string> records;
  size_t start = 0;
  while (start < output.size()) {
    size_t end = output.find('\0', start);
    if (end == std::string::npos) {
      end = output.size();
    }
    records.push_back(output.substr(start, end - start));
    start = end + 1;
  }

  std::vector<StatusEntry> entries;
  for (size_t i = 0; i < records.size(); ++i) {
    const std::string& record = records[i];
    if (record.size() < 4 || record[2] != ' ')
      continue;

    const char x = record[0];
    const char y = record[1];
    // Renames and copies carry the source path as the following record
    if (x == 'R' || x == 'C') {
      ++i;
    }

    ChangeKind kind = ChangeKind::Modified;
    if ((x == '?' && y == '?') || x == 'A') {
      kind = ChangeKind::Added;
    } else if (x == 'D' || y == 'D') {
      kind = ChangeKind::Deleted;
    }
    entries.push_back({record.substr(3), kind});
  }
  return entries;
}

std::vector<FileChangeInfo> GitChangeDetector::detect(const IndexMetadata& metadata) const {
  auto top = repository_root();
  if (!top) {
    return {};
  }

  ProcessResult status = SubProcess::run("git -C " + SubProcess::quote(scanner_.root().string()) +
                                         " status --porcelain -z --untracked-files=all");
  if (!status.success) {
    throw IndexerError("git status exited with code " + std::to_string(status.exit_code));
  }

  std::error_code ec;
  std::filesystem::path root = std::filesystem::weakly_canonical(scanner_.root(), ec);
  if (ec) {
    root = scanner_.root();
  }

  const auto now = std::chrono::system_clock::now();
  std::vector<FileChangeInfo> changes;
  for (const auto& entry : parse_porcelain(status.output)) {
    const std::filesystem::path absolute = (*top / entry.path).lexically_normal();
    const std::filesystem::path relative = absolute.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..")
      continue;
    if (!scanner_.is_relevant(relative))
      continue;

    FileChangeInfo info;
    info.path = relative.generic_string();
    info.kind = entry.kind;
    info.detected_at = now;
    info.source = DetectorSource::Git;

    auto known = metadata.file_hashes.find(info.path);
    if (info.kind == ChangeKind::Deleted) {
      // Never indexed, so nothing to invalidate
      if (known == metadata.file_hashes.end())
        continue;
      changes.push_back(std::move(info));
      continue;
    }

    try {
      info.hash = HashService::sha256_file(absolute);
    } catch (const HashError& e) {
      std::cerr << "Warning: [Indexer] git detector could not hash " << info.path << ": "
                << e.what() << std::endl;
    }
    if (known != metadata.file_hashes.end()) {
      // Uncommitted but already indexed at this content
      if (!info.hash.empty() && known->second == info.hash)
        continue;
      info.kind = ChangeKind::Modified;
    }
    changes.push_back(std::move(info));
  }
  return changes;
}

}  // namespace codelens_core
