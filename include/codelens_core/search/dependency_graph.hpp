#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace codelens_core {

// File -> files it directly depends on. May contain cycles.
using DependencyGraph = std::unordered_map<std::string, std::unordered_set<std::string>>;

// File -> files that directly depend on it
DependencyGraph reverse_graph(const DependencyGraph& graph);

// Every file reachable from `changed` along reverse edges, excluding `changed` itself. Sorted.
std::vector<std::string> transitive_dependents(const DependencyGraph& graph,
                                               const std::vector<std::string>& changed);

// Files within max_hops of start in either edge direction, with their hop distance.
// start itself is not included.
std::map<std::string, int> neighbors_within(const DependencyGraph& graph,
                                            const DependencyGraph& reversed,
                                            const std::string& start,
                                            int max_hops);

}  // namespace codelens_core
