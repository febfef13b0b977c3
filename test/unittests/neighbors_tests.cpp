#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "traversal/neighbors.hpp"
#include "traversal_tests.hpp"

TEST_CASE("neighbors at hop") {
  const auto Chain = buildChain();
  const auto &Graph = Chain.getGraph();
  const auto Start = Chain.node("B");

  verify(neighborsAtHop(Graph, Start, "", 1), {"A", "C"});
  verify(neighborsAtHop(Graph, Start, "", 2), {"D"});
  verify(neighborsAtHop(Graph, Start, "", 3), {});
  verify(neighborsAtHop(Graph, Start, "", 0), {"B"});
  verify(neighborsAtHop(Graph, Start, "", -1), {"B"});
  verify(neighborsAtHop(Graph, Start, "KNOWS>", 1), {"C"});
  verify(neighborsAtHop(Graph, Start, "<KNOWS", 1), {"A"});
  REQUIRE(neighborsAtHop(Graph, nullptr, "", 1).empty());
}

TEST_CASE("neighbors at hop use the shortest distance") {
  const auto Triangle = buildTriangle();
  // C is reachable in two hops through B but is a direct neighbor of A
  verify(neighborsAtHop(Triangle.getGraph(), Triangle.node("A"), "", 1),
         {"B", "C"});
  verify(neighborsAtHop(Triangle.getGraph(), Triangle.node("A"), "", 2), {});
}

TEST_CASE("neighbors to hop") {
  const auto Chain = buildChain();
  const auto &Graph = Chain.getGraph();

  verify(neighborsToHop(Graph, Chain.node("B"), "", 2), {"A", "C", "D"});
  verify(neighborsToHop(Graph, Chain.node("A"), "", 2), {"B", "C"});
  verify(neighborsToHop(Graph, Chain.node("A"), "", 0), {});
  verify(neighborsToHop(Graph, Chain.node("A"), "KNOWS>", 10),
         {"B", "C", "D"});
  verify(neighborsToHop(Graph, Chain.node("A"), "<KNOWS", 10), {});
}

TEST_CASE("count and existence of neighbors") {
  const auto Chain = buildChain();
  const auto &Graph = Chain.getGraph();

  REQUIRE(countNeighborsAtHop(Graph, Chain.node("B"), "", 1) == 2U);
  REQUIRE(countNeighborsAtHop(Graph, Chain.node("A"), "", 3) == 1U);
  REQUIRE(countNeighborsAtHop(Graph, Chain.node("A"), "", 0) == 1U);
  REQUIRE(hasNeighborsAtHop(Graph, Chain.node("A"), "", 3));
  REQUIRE_FALSE(hasNeighborsAtHop(Graph, Chain.node("A"), "", 4));
  REQUIRE_FALSE(hasNeighborsAtHop(Graph, nullptr, "", 1));
}

TEST_CASE("neighbors depth-first") {
  const auto Chain = buildChain();
  const auto &Graph = Chain.getGraph();
  const auto Start = Chain.node("B");

  verify(neighborsDepthFirst(Graph, Start, "", 10), {"B", "A", "C", "D"});
  verify(neighborsDepthFirst(Graph, Start, "", 1), {"B", "A", "C"});
  verify(neighborsDepthFirst(Graph, Start, "", 0), {"B"});
  verify(neighborsDepthFirst(Graph, Start, "", -1), {});
  verify(neighborsDepthFirst(Graph, Start, "KNOWS>", 10), {"B", "C", "D"});
  REQUIRE(neighborsDepthFirst(Graph, nullptr, "", 10).empty());

  // C is too deep below B but still a direct neighbor of A
  const auto Triangle = buildTriangle();
  verify(neighborsDepthFirst(Triangle.getGraph(), Triangle.node("A"), "", 1),
         {"A", "B", "C"});
}
