#pragma once

#include <filesystem>
#include <string>

namespace codelens_core {

// Replaces path with contents through a sibling temp file and a rename, so readers see
// either the old file or the new one. Throws std::runtime_error.
void write_file_atomically(const std::filesystem::path& path, const std::string& contents);

}  // namespace codelens_core
