#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "codelens_core/types/chunk.hpp"

namespace codelens_core {

// Restricts a search to chunks satisfying every field that is set.
struct ChunkFilter {
  std::optional<std::string> file_path;
  std::set<ChunkKind> kinds;
  std::optional<int> min_complexity;
  std::optional<int> max_complexity;
  // Extensions with or without the leading dot ("ts" and ".ts" are equivalent)
  std::vector<std::string> file_types;
  // Exact file paths to leave out
  std::vector<std::string> exclude_files;

  bool empty() const;
  bool matches(const std::string& chunk_file_path, ChunkKind kind, int complexity) const;
  bool matches(const CodeChunk& chunk) const {
    return matches(chunk.file_path, chunk.kind, chunk.complexity);
  }
};

}  // namespace codelens_core
