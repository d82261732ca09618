#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "codelens_core/types/chunk.hpp"

namespace codelens_core {

struct KeywordMatch {
  int matched_terms = 0;   // distinct query terms found in the chunk
  int term_frequency = 0;  // total occurrences of those terms
};

/**
 * Inverted index from lowercase terms to the chunks containing them.
 * Also keeps a catalogue of the indexed chunks (without embeddings) by id and by file,
 * which the dependency signal uses to resolve files to chunks.
 */
class KeywordIndex {
 public:
  // Lowercases, splits on anything outside [A-Za-z0-9_], drops short terms and stopwords
  static std::vector<std::string> tokenize(const std::string& text);

  void build(const std::vector<CodeChunk>& chunks);
  // Replaces all chunks belonging to file_path
  void update_file(const std::string& file_path, const std::vector<CodeChunk>& chunks);

  // query_terms are expected to be distinct
  std::unordered_map<std::string, KeywordMatch> search(
      const std::vector<std::string>& query_terms) const;

  const CodeChunk* chunk(const std::string& id) const;
  std::vector<const CodeChunk*> chunks_in_file(const std::string& file_path) const;

  size_t size() const { return chunks_.size(); }
  size_t term_count() const { return postings_.size(); }

 private:
  void add_chunk(const CodeChunk& chunk);
  void remove_chunk(const std::string& id);

  // term -> (chunk id -> occurrences)
  std::unordered_map<std::string, std::unordered_map<std::string, int>> postings_;
  std::unordered_map<std::string, CodeChunk> chunks_;
  std::unordered_map<std::string, std::set<std::string>> file_chunks_;
};

}  // namespace codelens_core
