#pragma once

#include <string>
#include <vector>

namespace codelens_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Turns text into a fixed-length vector. Implementations talk to an external model.
 * A thrown EmbeddingError means "no embedding available"; callers degrade instead of failing.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed(const std::string& text) = 0;
  virtual size_t dimension() const = 0;
};

}  // namespace codelens_core
