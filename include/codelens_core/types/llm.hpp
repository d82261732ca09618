#pragma once

#include <string>

namespace codelens_core {

struct LlmRequest {
  std::string provider;
  std::string model;
  std::string prompt;
  double temperature = 0.0;
  int max_tokens = 0;
};

struct TokenUsage {
  int prompt_tokens = 0;
  int completion_tokens = 0;
  int total_tokens = 0;
};

struct LlmResponse {
  std::string content;
  TokenUsage usage;
  std::string finish_reason;
};

}  // namespace codelens_core
