#pragma once

#include "codelens_core/indexing/change_detector.hpp"
#include "codelens_core/indexing/project_scanner.hpp"

namespace codelens_core {

// Compares SHA-256 of every tracked and discovered file against the saved hashes.
class HashChangeDetector : public ChangeDetector {
 public:
  explicit HashChangeDetector(ProjectScanner scanner);

  DetectorSource source() const override { return DetectorSource::Hash; }
  std::vector<FileChangeInfo> detect(const IndexMetadata& metadata) const override;

 private:
  ProjectScanner scanner_;
};

}  // namespace codelens_core
