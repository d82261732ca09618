#pragma once

#include <optional>

#include "codelens_core/indexing/change_detector.hpp"
#include "codelens_core/indexing/project_scanner.hpp"

namespace codelens_core {

// Reads `git status --porcelain -z`. Unavailable outside a work tree or without git.
class GitChangeDetector : public ChangeDetector {
 public:
  explicit GitChangeDetector(ProjectScanner scanner);

  DetectorSource source() const override { return DetectorSource::Git; }
  bool is_available() const override;
  std::vector<FileChangeInfo> detect(const IndexMetadata& metadata) const override;

  struct StatusEntry {
    std::string path;  // relative to the repository top level
    ChangeKind kind;
  };
  // Parses NUL-separated porcelain v1 output. Paths are raw bytes, never quoted;
  // renames report the new path
  static std::vector<StatusEntry> parse_porcelain(const std::string& output);

 private:
  std::optional<std::filesystem::path> repository_root() const;

  ProjectScanner scanner_;
};

}  // namespace codelens_core
