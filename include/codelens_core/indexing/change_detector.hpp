#pragma once

#include <string>
#include <vector>

#include "codelens_core/indexing/index_metadata.hpp"
#include "codelens_core/types/file_change.hpp"

namespace codelens_core {

/**
 * One way of finding files that changed since the last saved index.
 * Detectors only read shared state, so several may run at once.
 */
class ChangeDetector {
 public:
  virtual ~ChangeDetector() = default;

  virtual DetectorSource source() const = 0;

  // Capability check; an unavailable detector is skipped without a warning
  virtual bool is_available() const { return true; }

  virtual std::vector<FileChangeInfo> detect(const IndexMetadata& metadata) const = 0;

  std::string name() const { return to_string(source()); }
};

}  // namespace codelens_core
