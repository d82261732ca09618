#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "codelens_core/search/dependency_graph.hpp"

namespace codelens_core {

using ::testing::ElementsAre;

TEST(DependencyGraphTest, ReverseGraph_FlipsEdges) {
  DependencyGraph graph{{"B.ts", {"A.ts"}}, {"C.ts", {"A.ts", "B.ts"}}};

  DependencyGraph reversed = reverse_graph(graph);

  EXPECT_EQ(reversed.at("A.ts"), (std::unordered_set<std::string>{"B.ts", "C.ts"}));
  EXPECT_EQ(reversed.at("B.ts"), (std::unordered_set<std::string>{"C.ts"}));
  EXPECT_EQ(reversed.count("C.ts"), 0u);
}

TEST(DependencyGraphTest, TransitiveDependents_ChainReturnsAllDownstreamFiles) {
  // B imports A, C imports B
  DependencyGraph graph{{"A.ts", {}}, {"B.ts", {"A.ts"}}, {"C.ts", {"B.ts"}}};

  EXPECT_THAT(transitive_dependents(graph, {"A.ts"}), ElementsAre("B.ts", "C.ts"));
  EXPECT_THAT(transitive_dependents(graph, {"B.ts"}), ElementsAre("C.ts"));
  EXPECT_TRUE(transitive_dependents(graph, {"C.ts"}).empty());
}

TEST(DependencyGraphTest, TransitiveDependents_TerminatesOnCycle) {
  DependencyGraph graph{{"A.ts", {"B.ts"}}, {"B.ts", {"C.ts"}}, {"C.ts", {"A.ts"}}};

  EXPECT_THAT(transitive_dependents(graph, {"A.ts"}), ElementsAre("B.ts", "C.ts"));
}

TEST(DependencyGraphTest, TransitiveDependents_ExcludesChangedFiles) {
  DependencyGraph graph{{"B.ts", {"A.ts"}}, {"C.ts", {"B.ts"}}};

  EXPECT_THAT(transitive_dependents(graph, {"A.ts", "B.ts"}), ElementsAre("C.ts"));
  EXPECT_TRUE(transitive_dependents(graph, {}).empty());
  EXPECT_TRUE(transitive_dependents(graph, {"unknown.ts"}).empty());
}

TEST(DependencyGraphTest, NeighborsWithin_WalksBothDirectionsUpToMaxHops) {
  // A -> B -> C -> D, and E depends on A
  DependencyGraph graph{{"A.ts", {"B.ts"}}, {"B.ts", {"C.ts"}}, {"C.ts", {"D.ts"}},
                        {"E.ts", {"A.ts"}}};
  DependencyGraph reversed = reverse_graph(graph);

  auto within_two = neighbors_within(graph, reversed, "A.ts", 2);

  EXPECT_EQ(within_two, (std::map<std::string, int>{{"B.ts", 1}, {"C.ts", 2}, {"E.ts", 1}}));
  EXPECT_TRUE(neighbors_within(graph, reversed, "A.ts", 0).empty());
}

TEST(DependencyGraphTest, NeighborsWithin_CycleDoesNotRevisitStart) {
  DependencyGraph graph{{"A.ts", {"B.ts"}}, {"B.ts", {"A.ts"}}};
  DependencyGraph reversed = reverse_graph(graph);

  auto neighbors = neighbors_within(graph, reversed, "A.ts", 5);

  EXPECT_EQ(neighbors, (std::map<std::string, int>{{"B.ts", 1}}));
}

}  // namespace codelens_core
