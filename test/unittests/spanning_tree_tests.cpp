#include <cstddef>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "traversal/config.hpp"
#include "traversal/spanning_tree.hpp"
#include "traversal_tests.hpp"

TEST_CASE("spanning tree") {
  const auto Diamond = buildDiamond();
  const auto &Graph = Diamond.getGraph();
  const auto Start = Diamond.node("A");

  SECTION("one path per reached node") {
    const auto Paths = spanningTree(Graph, Start, TraversalConfig{});
    REQUIRE(toStrings(Paths) ==
            std::vector<std::string>{"A-B", "A-C", "A-B-D"});
  }

  SECTION("levels") {
    REQUIRE(toStrings(spanningTree(Graph, Start,
                                   TraversalConfig{.MinLevel = 2})) ==
            std::vector<std::string>{"A-B-D"});
    REQUIRE(toStrings(spanningTree(Graph, Start,
                                   TraversalConfig{.MaxLevel = 1})) ==
            std::vector<std::string>{"A-B", "A-C"});
    REQUIRE(spanningTree(Graph, Start, TraversalConfig{.MaxLevel = 0}).empty());
    REQUIRE(spanningTree(Graph, Start,
                         TraversalConfig{.MinLevel = 3, .MaxLevel = 2})
                .empty());
  }

  SECTION("limit") {
    REQUIRE(toStrings(spanningTree(Graph, Start,
                                   TraversalConfig{.Limit = 2})) ==
            std::vector<std::string>{"A-B", "A-C"});
    REQUIRE(spanningTree(Graph, Start, TraversalConfig{.Limit = -3}).size() ==
            3U);
  }

  SECTION("uniqueness and strategy are ignored") {
    REQUIRE(toStrings(spanningTree(Graph, Start,
                                   TraversalConfig{.Unique = Uniqueness::None,
                                                   .Bfs = false})) ==
            std::vector<std::string>{"A-B", "A-C", "A-B-D"});
  }

  SECTION("no start node") {
    REQUIRE(spanningTree(Graph, nullptr, TraversalConfig{}).empty());
  }
}

TEST_CASE("spanning tree covers cycles once") {
  const auto Triangle = buildTriangle();
  const auto Paths =
      spanningTree(Triangle.getGraph(), Triangle.node("A"), TraversalConfig{});
  REQUIRE(toStrings(Paths) == std::vector<std::string>{"A-B", "A-C"});
  for (const auto &Val : Paths) {
    REQUIRE(Val.getNodes().size() == Val.getRelationships().size() + 1U);
  }
}
