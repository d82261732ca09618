#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace codelens_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Encodes chunk content for the `content` BLOB column.
 *
 * Non-empty blobs start with a one-byte tag: 'R' for raw bytes or 'Z' for a zstd
 * frame. Short chunks and chunks zstd cannot shrink are stored raw. Empty content
 * is an empty blob.
 */
class CompressionService {
 public:
  static constexpr char kRawTag = 'R';
  static constexpr char kZstdTag = 'Z';
  // Below this, frame overhead outweighs any saving
  static constexpr size_t kMinCompressBytes = 64;
  // Declared frame sizes above this are treated as corrupt
  static constexpr size_t kMaxContentBytes = 64 * 1024 * 1024;
  static constexpr int kDefaultLevel = 3;

  static std::vector<char> encode(std::string_view content, int level = kDefaultLevel);

  // Throws CompressionError on an unknown tag or a damaged frame
  static std::string decode(const std::vector<char>& blob);

  static bool is_compressed(const std::vector<char>& blob) {
    return !blob.empty() && blob.front() == kZstdTag;
  }
};

}  // namespace codelens_core
