#pragma once

#include <string>
#include <vector>

namespace codelens_core {

enum class ChunkKind { Function, Class, Method, Interface, Type, Variable, Module, Other };

std::string to_string(ChunkKind kind);
// Unknown names map to ChunkKind::Other
ChunkKind chunk_kind_from_string(const std::string& str);

struct CodeChunk {
  std::string id;
  std::string file_path;
  std::string name;
  std::string content;
  ChunkKind kind = ChunkKind::Other;
  int loc = 0;
  int complexity = 0;
  std::vector<float> embedding;
  // Files or symbols referenced by this chunk, carried through for callers
  std::vector<std::string> dependencies;
};

}  // namespace codelens_core
