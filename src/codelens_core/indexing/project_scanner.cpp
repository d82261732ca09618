#include "codelens_core/indexing/project_scanner.hpp"

#include <algorithm>
#include <iostream>

namespace codelens_core {

ProjectScanner::ProjectScanner(ScanOptions options) : options_(std::move(options)) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(options_.root, ec);
  if (!ec) {
    options_.root = absolute.lexically_normal();
  }
}

bool ProjectScanner::is_relevant(const std::filesystem::path& relative_path) const {
  if (options_.extensions.count(relative_path.extension().string()) == 0) {
    return false;
  }
  for (const auto& part : relative_path.parent_path()) {
    if (options_.ignore_dirs.count(part.string()) > 0) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> ProjectScanner::scan() const {
  std::vector<std::string> files;
  std::error_code ec;
  if (!std::filesystem::is_directory(options_.root, ec)) {
    std::cerr << "[Scanner] Project root does not exist: " << options_.root.string() << std::endl;
    return files;
  }

  const auto opts = std::filesystem::directory_options::skip_permission_denied;
  try {
    for (auto it = std::filesystem::recursive_directory_iterator(options_.root, opts);
         it != std::filesystem::recursive_directory_iterator(); ++it) {
      std::error_code ec2;
      if (it->is_directory(ec2)) {
        if (options_.ignore_dirs.count(it->path().filename().string()) > 0) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (!it->is_regular_file(ec2))
        continue;
      auto relative = it->path().lexically_relative(options_.root);
      if (is_relevant(relative)) {
        files.push_back(relative.generic_string());
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    std::cerr << "[Scanner] scan error: " << e.what() << std::endl;
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::string ProjectScanner::to_key(const std::filesystem::path& path) const {
  if (path.is_relative()) {
    return path.lexically_normal().generic_string();
  }
  auto relative = path.lexically_normal().lexically_relative(options_.root);
  if (relative.empty() || *relative.begin() == "..") {
    return path.lexically_normal().generic_string();
  }
  return relative.generic_string();
}

std::filesystem::path ProjectScanner::to_absolute(const std::string& key) const {
  std::filesystem::path p(key);
  return p.is_absolute() ? p : options_.root / p;
}

}  // namespace codelens_core
