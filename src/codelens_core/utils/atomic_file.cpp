#include "codelens_core/utils/atomic_file.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace codelens_core {

void write_file_atomically(const std::filesystem::path& path, const std::string& contents) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  std::ostringstream suffix;
  suffix << ".tmp." << ::getpid() << "." << std::this_thread::get_id();
  std::filesystem::path tmp_path = path;
  tmp_path += suffix.str();

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Failed to open " + tmp_path.string() + " for writing");
    }
    out << contents;
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw std::runtime_error("Failed to write " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw std::runtime_error("Failed to replace " + path.string() + ": " + ec.message());
  }
}

}  // namespace codelens_core
