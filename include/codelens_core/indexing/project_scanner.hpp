#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace codelens_core {

struct ScanOptions {
  std::filesystem::path root;
  std::set<std::string> extensions{".ts", ".tsx", ".js", ".jsx", ".h", ".hpp", ".cc", ".cpp"};
  std::set<std::string> ignore_dirs{"node_modules", "dist", ".next", "build", ".git", ".codelens"};
};

// Enumerates the source files an index cycle cares about.
class ProjectScanner {
 public:
  explicit ProjectScanner(ScanOptions options);

  // Project-relative generic paths, sorted
  std::vector<std::string> scan() const;

  // True for a project-relative path with a tracked extension outside ignored directories
  bool is_relevant(const std::filesystem::path& relative_path) const;

  // Project-relative key when path is under the root, otherwise the absolute path
  std::string to_key(const std::filesystem::path& path) const;
  std::filesystem::path to_absolute(const std::string& key) const;

  const std::filesystem::path& root() const { return options_.root; }

 private:
  ScanOptions options_;
};

}  // namespace codelens_core
