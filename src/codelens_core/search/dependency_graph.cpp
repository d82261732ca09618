#include "codelens_core/search/dependency_graph.hpp"

#include <algorithm>
#include <queue>

namespace codelens_core {

DependencyGraph reverse_graph(const DependencyGraph& graph) {
  DependencyGraph reversed;
  for (const auto& [file, deps] : graph) {
    for (const auto& dep : deps) {
      reversed[dep].insert(file);
    }
  }
  return reversed;
}

std::vector<std::string> transitive_dependents(const DependencyGraph& graph,
                                               const std::vector<std::string>& changed) {
  const DependencyGraph reversed = reverse_graph(graph);

  std::unordered_set<std::string> visited(changed.begin(), changed.end());
  std::queue<std::string> frontier;
  for (const auto& file : changed) {
    frontier.push(file);
  }

  std::vector<std::string> affected;
  while (!frontier.empty()) {
    const std::string current = frontier.front();
    frontier.pop();

    auto it = reversed.find(current);
    if (it == reversed.end())
      continue;
    for (const auto& dependent : it->second) {
      if (visited.insert(dependent).second) {
        affected.push_back(dependent);
        frontier.push(dependent);
      }
    }
  }

  std::sort(affected.begin(), affected.end());
  return affected;
}

std::map<std::string, int> neighbors_within(const DependencyGraph& graph,
                                            const DependencyGraph& reversed,
                                            const std::string& start,
                                            int max_hops) {
  std::map<std::string, int> distances;
  std::unordered_set<std::string> visited{start};
  std::queue<std::pair<std::string, int>> frontier;
  frontier.push({start, 0});

  auto expand = [&](const DependencyGraph& edges, const std::string& file, int hop) {
    auto it = edges.find(file);
    if (it == edges.end())
      return;
    for (const auto& next : it->second) {
      if (visited.insert(next).second) {
        distances[next] = hop + 1;
        frontier.push({next, hop + 1});
      }
    }
  };

  while (!frontier.empty()) {
    auto [file, hop] = frontier.front();
    frontier.pop();
    if (hop >= max_hops)
      continue;
    expand(graph, file, hop);
    expand(reversed, file, hop);
  }
  return distances;
}

}  // namespace codelens_core
