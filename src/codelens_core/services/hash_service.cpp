#include "codelens_core/services/hash_service.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace codelens_core {

namespace {

using EvpContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpContext make_sha256_context() {
  EvpContext mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!mdctx) {
    throw HashError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw HashError("Failed to initialize SHA256 digest");
  }
  return mdctx;
}

std::string finalize_hex(EVP_MD_CTX* mdctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    throw HashError("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string HashService::sha256_hex(std::string_view data) {
  EvpContext mdctx = make_sha256_context();
  if (EVP_DigestUpdate(mdctx.get(), data.data(), data.size()) != 1) {
    throw HashError("Failed to update SHA256 digest");
  }
  return finalize_hex(mdctx.get());
}

std::string HashService::sha256_file(const std::filesystem::path& file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw HashError("Could not open file: " + file_path.string());
  }

  EvpContext mdctx = make_sha256_context();
  std::array<char, 64 * 1024> buffer;
  while (file_stream) {
    file_stream.read(buffer.data(), buffer.size());
    std::streamsize n = file_stream.gcount();
    if (n > 0 && EVP_DigestUpdate(mdctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
      throw HashError("Failed to update SHA256 digest");
    }
  }
  if (file_stream.bad()) {
    throw HashError("Failed while reading file: " + file_path.string());
  }
  return finalize_hex(mdctx.get());
}

}  // namespace codelens_core
