#include "codelens_core/services/compression_service.hpp"

#include <zstd.h>

namespace codelens_core {

namespace {

std::vector<char> raw_blob(std::string_view content) {
  std::vector<char> blob;
  blob.reserve(content.size() + 1);
  blob.push_back(CompressionService::kRawTag);
  blob.insert(blob.end(), content.begin(), content.end());
  return blob;
}

}  // namespace

std::vector<char> CompressionService::encode(std::string_view content, int level) {
  if (content.empty()) {
    return {};
  }
  if (content.size() < kMinCompressBytes) {
    return raw_blob(content);
  }

  std::vector<char> blob(1 + ZSTD_compressBound(content.size()));
  blob[0] = kZstdTag;
  const size_t frame_size =
      ZSTD_compress(blob.data() + 1, blob.size() - 1, content.data(), content.size(), level);
  if (ZSTD_isError(frame_size)) {
    throw CompressionError("zstd could not compress chunk content: " +
                           std::string(ZSTD_getErrorName(frame_size)));
  }
  if (frame_size >= content.size()) {
    return raw_blob(content);
  }
  blob.resize(1 + frame_size);
  return blob;
}

std::string CompressionService::decode(const std::vector<char>& blob) {
  if (blob.empty()) {
    return "";
  }
  if (blob[0] == kRawTag) {
    return std::string(blob.begin() + 1, blob.end());
  }
  if (blob[0] != kZstdTag) {
    throw CompressionError("Chunk content has unknown encoding tag " +
                           std::to_string(static_cast<unsigned char>(blob[0])));
  }

  const char* frame = blob.data() + 1;
  const size_t frame_size = blob.size() - 1;
  const unsigned long long declared = ZSTD_getFrameContentSize(frame, frame_size);
  if (declared == ZSTD_CONTENTSIZE_ERROR || declared == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Chunk content is not a zstd frame with a known size");
  }
  if (declared > kMaxContentBytes) {
    throw CompressionError("Chunk content frame declares " + std::to_string(declared) +
                           " bytes, above the " + std::to_string(kMaxContentBytes) + " limit");
  }

  std::string content(static_cast<size_t>(declared), '\0');
  const size_t written = ZSTD_decompress(content.data(), content.size(), frame, frame_size);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd could not decompress chunk content: " +
                           std::string(ZSTD_getErrorName(written)));
  }
  if (written != content.size()) {
    throw CompressionError("Chunk content frame produced " + std::to_string(written) +
                           " bytes, expected " + std::to_string(declared));
  }
  return content;
}

}  // namespace codelens_core
