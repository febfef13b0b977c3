#include <string>
#include <vector>

#include "traversal/in_memory_graph.hpp"
#include "traversal_benchmarks.hpp"

namespace {
[[nodiscard]] InMemoryGraph buildSingleNode() {
  auto Graph = InMemoryGraph{};
  Graph.addNode({"Person"});
  return Graph;
}

// people that know each other, working at two companies
[[nodiscard]] InMemoryGraph buildSocialGraph() {
  auto Graph = InMemoryGraph{};
  const auto Alice = Graph.addNode({"Person"});
  const auto Bob = Graph.addNode({"Person"});
  const auto Carol = Graph.addNode({"Person"});
  const auto Dave = Graph.addNode({"Person", "Admin"});
  const auto Acme = Graph.addNode({"Company"});
  const auto Initech = Graph.addNode({"Company"});
  const auto Erin = Graph.addNode({"Person"});

  Graph.addRelationship(Alice, Bob, "KNOWS");
  Graph.addRelationship(Bob, Carol, "KNOWS");
  Graph.addRelationship(Carol, Alice, "KNOWS");
  Graph.addRelationship(Carol, Dave, "KNOWS");
  Graph.addRelationship(Alice, Acme, "WORKS_AT");
  Graph.addRelationship(Bob, Acme, "WORKS_AT");
  Graph.addRelationship(Dave, Initech, "WORKS_AT");
  Graph.addRelationship(Erin, Initech, "WORKS_AT");
  Graph.addRelationship(Dave, Erin, "LIKES");
  return Graph;
}

// 4x4 grid, every node connected to its right and lower neighbor
[[nodiscard]] InMemoryGraph buildGrid() {
  constexpr auto Width = 4;
  auto Graph = InMemoryGraph{};
  auto Ids = std::vector<NodeId>{};
  for (auto Index = 0; Index < Width * Width; ++Index) {
    Ids.push_back(Graph.addNode({"Cell"}));
  }
  for (auto Row = 0; Row < Width; ++Row) {
    for (auto Column = 0; Column < Width; ++Column) {
      const auto Current = Ids[(Row * Width) + Column];
      if (Column + 1 < Width) {
        Graph.addRelationship(Current, Ids[(Row * Width) + Column + 1],
                              "RIGHT");
      }
      if (Row + 1 < Width) {
        Graph.addRelationship(Current, Ids[((Row + 1) * Width) + Column],
                              "DOWN");
      }
    }
  }
  return Graph;
}
} // namespace

// NOLINTNEXTLINE
GENERATE_BENCHMARKS(baseline, buildSingleNode);

// NOLINTNEXTLINE
GENERATE_BENCHMARKS(social, buildSocialGraph);

// NOLINTNEXTLINE
GENERATE_BENCHMARKS(grid, buildGrid);
