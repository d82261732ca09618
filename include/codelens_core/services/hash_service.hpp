#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace codelens_core {

class HashError : public std::exception {
 public:
  explicit HashError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class HashService {
 public:
  /**
   * @brief Computes the SHA-256 digest of a block of data.
   * @return Lowercase hex string (64 characters).
   */
  static std::string sha256_hex(std::string_view data);

  /**
   * @brief Computes the SHA-256 digest of a file's raw bytes, streamed in blocks.
   * @throws HashError if the file cannot be opened or read.
   */
  static std::string sha256_file(const std::filesystem::path& file_path);
};

}  // namespace codelens_core
