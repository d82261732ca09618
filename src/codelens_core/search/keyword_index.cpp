#include "codelens_core/search/keyword_index.hpp"

#include <cctype>
#include <unordered_set>

namespace codelens_core {

namespace {

const std::unordered_set<std::string>& stopwords() {
  static const std::unordered_set<std::string> words = {"the", "a",  "an", "and", "or", "but",
                                                        "in",  "on", "at", "to",  "for"};
  return words;
}

bool is_word_char(unsigned char c) {
  return std::isalnum(c) || c == '_';
}

}  // namespace

std::vector<std::string> KeywordIndex::tokenize(const std::string& text) {
  std::vector<std::string> terms;
  std::string current;
  auto flush = [&]() {
    if (current.size() > 2 && stopwords().count(current) == 0) {
      terms.push_back(current);
    }
    current.clear();
  };

  for (unsigned char c : text) {
    if (c < 0x80 && is_word_char(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();
  return terms;
}

void KeywordIndex::build(const std::vector<CodeChunk>& chunks) {
  postings_.clear();
  chunks_.clear();
  file_chunks_.clear();
  for (const auto& chunk : chunks) {
    remove_chunk(chunk.id);
    add_chunk(chunk);
  }
}

void KeywordIndex::update_file(const std::string& file_path, const std::vector<CodeChunk>& chunks) {
  auto it = file_chunks_.find(file_path);
  if (it != file_chunks_.end()) {
    const std::set<std::string> ids = it->second;
    for (const auto& id : ids) {
      remove_chunk(id);
    }
  }
  for (const auto& chunk : chunks) {
    remove_chunk(chunk.id);
    add_chunk(chunk);
  }
}

void KeywordIndex::add_chunk(const CodeChunk& chunk) {
  std::unordered_map<std::string, int> counts;
  for (auto& term : tokenize(chunk.content)) {
    counts[term]++;
  }
  for (auto& term : tokenize(chunk.name)) {
    counts[term]++;
  }
  for (const auto& [term, count] : counts) {
    postings_[term][chunk.id] = count;
  }

  CodeChunk stored = chunk;
  stored.embedding.clear();
  stored.embedding.shrink_to_fit();
  chunks_[chunk.id] = std::move(stored);
  file_chunks_[chunk.file_path].insert(chunk.id);
}

void KeywordIndex::remove_chunk(const std::string& id) {
  auto it = chunks_.find(id);
  if (it == chunks_.end()) {
    return;
  }
  const CodeChunk& chunk = it->second;

  std::unordered_set<std::string> terms;
  for (auto& term : tokenize(chunk.content)) {
    terms.insert(std::move(term));
  }
  for (auto& term : tokenize(chunk.name)) {
    terms.insert(std::move(term));
  }
  for (const auto& term : terms) {
    auto posting = postings_.find(term);
    if (posting == postings_.end())
      continue;
    posting->second.erase(id);
    if (posting->second.empty()) {
      postings_.erase(posting);
    }
  }

  auto file_it = file_chunks_.find(chunk.file_path);
  if (file_it != file_chunks_.end()) {
    file_it->second.erase(id);
    if (file_it->second.empty()) {
      file_chunks_.erase(file_it);
    }
  }
  chunks_.erase(it);
}

std::unordered_map<std::string, KeywordMatch> KeywordIndex::search(
    const std::vector<std::string>& query_terms) const {
  std::unordered_map<std::string, KeywordMatch> matches;
  for (const auto& term : query_terms) {
    auto posting = postings_.find(term);
    if (posting == postings_.end())
      continue;
    for (const auto& [id, count] : posting->second) {
      KeywordMatch& m = matches[id];
      m.matched_terms++;
      m.term_frequency += count;
    }
  }
  return matches;
}

const CodeChunk* KeywordIndex::chunk(const std::string& id) const {
  auto it = chunks_.find(id);
  return it == chunks_.end() ? nullptr : &it->second;
}

std::vector<const CodeChunk*> KeywordIndex::chunks_in_file(const std::string& file_path) const {
  std::vector<const CodeChunk*> result;
  auto it = file_chunks_.find(file_path);
  if (it == file_chunks_.end()) {
    return result;
  }
  for (const auto& id : it->second) {
    result.push_back(&chunks_.at(id));
  }
  return result;
}

}  // namespace codelens_core
