#include "codelens_core/types.hpp"

#include <algorithm>
#include <filesystem>

namespace codelens_core {

std::string to_string(ChunkKind kind) {
  switch (kind) {
    case ChunkKind::Function:
      return "function";
    case ChunkKind::Class:
      return "class";
    case ChunkKind::Method:
      return "method";
    case ChunkKind::Interface:
      return "interface";
    case ChunkKind::Type:
      return "type";
    case ChunkKind::Variable:
      return "variable";
    case ChunkKind::Module:
      return "module";
    default:
      return "other";
  }
}

ChunkKind chunk_kind_from_string(const std::string& str) {
  if (str == "function")
    return ChunkKind::Function;
  if (str == "class")
    return ChunkKind::Class;
  if (str == "method")
    return ChunkKind::Method;
  if (str == "interface")
    return ChunkKind::Interface;
  if (str == "type")
    return ChunkKind::Type;
  if (str == "variable")
    return ChunkKind::Variable;
  if (str == "module")
    return ChunkKind::Module;
  return ChunkKind::Other;
}

std::string to_string(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::Added:
      return "added";
    case ChangeKind::Modified:
      return "modified";
    case ChangeKind::Deleted:
      return "deleted";
    default:
      return "unknown";
  }
}

std::string to_string(DetectorSource source) {
  switch (source) {
    case DetectorSource::Git:
      return "git";
    case DetectorSource::Hash:
      return "hash";
    case DetectorSource::Timestamp:
      return "timestamp";
    default:
      return "unknown";
  }
}

bool ChunkFilter::empty() const {
  return !file_path && kinds.empty() && !min_complexity && !max_complexity &&
         file_types.empty() && exclude_files.empty();
}

bool ChunkFilter::matches(const std::string& chunk_file_path,
                          ChunkKind kind,
                          int complexity) const {
  if (file_path && *file_path != chunk_file_path) {
    return false;
  }
  if (!kinds.empty() && kinds.count(kind) == 0) {
    return false;
  }
  if (min_complexity && complexity < *min_complexity) {
    return false;
  }
  if (max_complexity && complexity > *max_complexity) {
    return false;
  }
  if (!file_types.empty()) {
    std::string ext = std::filesystem::path(chunk_file_path).extension().string();
    if (!ext.empty() && ext.front() == '.') {
      ext.erase(0, 1);
    }
    bool found = std::any_of(file_types.begin(), file_types.end(), [&](const std::string& t) {
      return !ext.empty() && (t == ext || t == "." + ext);
    });
    if (!found) {
      return false;
    }
  }
  if (std::find(exclude_files.begin(), exclude_files.end(), chunk_file_path) !=
      exclude_files.end()) {
    return false;
  }
  return true;
}

}  // namespace codelens_core
