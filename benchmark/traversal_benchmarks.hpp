#ifndef traversal_benchmark_traversal_benchmarks_hpp
#define traversal_benchmark_traversal_benchmarks_hpp

#include <cstdint>
#include <utility>
#include <variant>

#include <benchmark/benchmark.h>
#include <range/v3/view/indices.hpp>

#include "support/testcase_generation.hpp"
#include "support/traversal_exception.hpp"
#include "traversal/config.hpp"
#include "traversal/expand.hpp"
#include "traversal/graph_types.hpp"
#include "traversal/in_memory_graph.hpp"
#include "traversal/shortest_path.hpp"
#include "traversal/spanning_tree.hpp"
#include "traversal/subgraph.hpp"

// generated node I gets the id I + 1
[[nodiscard]] inline InMemoryGraph buildGraph(const GeneratedGraph &Generated) {
  auto Graph = InMemoryGraph{};
  for ([[maybe_unused]] const auto Index :
       ranges::views::indices(Generated.NumNodes)) {
    Graph.addNode();
  }
  for (const auto &Edge : Generated.Edges) {
    Graph.addRelationship(static_cast<NodeId>(Edge.Start) + 1,
                          static_cast<NodeId>(Edge.End) + 1, Edge.Type);
  }
  return Graph;
}

[[nodiscard]] inline NodePtr getNodeOrFail(const InMemoryGraph &Graph,
                                           const NodeId Id) {
  auto Result = Graph.getNode(Id);
  TraversalException::verify(std::holds_alternative<NodePtr>(Result),
                             "benchmark graph has no node {}", Id);
  return std::get<NodePtr>(std::move(Result));
}

inline void setupCounters(benchmark::State &State, const InMemoryGraph &Graph,
                          const NodePtr &Start) {
  const auto Conf = TraversalConfig{};
  State.counters["nodes"] = static_cast<double>(Graph.getNodeCount());
  State.counters["relationships"] =
      static_cast<double>(Graph.getRelationshipCount());
  State.counters["paths"] =
      static_cast<double>(expandConfig(Graph, Start, Conf).size());
  State.counters["reached"] =
      static_cast<double>(subgraphNodes(Graph, Start, Conf).size());
}

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define SETUP_BENCHMARK(GraphValue)                                            \
  const auto Graph = GraphValue;                                               \
  const auto Start = getNodeOrFail(Graph, 1);                                  \
  const auto End =                                                             \
      getNodeOrFail(Graph, static_cast<NodeId>(Graph.getNodeCount()));         \
  const auto MaxHops = static_cast<std::int64_t>(Graph.getNodeCount());        \
  const auto Conf = TraversalConfig{};                                         \
  setupCounters(State, Graph, Start);

#define BENCHMARK_BODY_EXPAND                                                  \
  auto Paths = expandConfig(Graph, Start, Conf);                               \
  benchmark::DoNotOptimize(Paths.data());                                      \
  benchmark::ClobberMemory();

#define BENCHMARK_BODY_EXPAND_BFS                                              \
  auto Paths = expandConfig(Graph, Start, TraversalConfig{.Bfs = true});       \
  benchmark::DoNotOptimize(Paths.data());                                      \
  benchmark::ClobberMemory();

#define BENCHMARK_BODY_SPANNING_TREE                                           \
  auto Paths = spanningTree(Graph, Start, Conf);                               \
  benchmark::DoNotOptimize(Paths.data());                                      \
  benchmark::ClobberMemory();

#define BENCHMARK_BODY_SUBGRAPH                                                \
  auto Result = subgraphAll(Graph, Start, Conf);                               \
  benchmark::DoNotOptimize(Result.Nodes.data());                               \
  benchmark::DoNotOptimize(Result.Relationships.data());                       \
  benchmark::ClobberMemory();

#define BENCHMARK_BODY_SHORTEST_PATHS                                          \
  auto Paths = allShortestPaths(Graph, Start, End, "", MaxHops);               \
  benchmark::DoNotOptimize(Paths.data());                                      \
  benchmark::ClobberMemory();

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DEFINE_GENERATED_BENCHMARK(Name, Kind, Generator, Body, Args)          \
  BENCHMARK_DEFINE_F(Name, Kind)(benchmark::State & State) {                   \
    SETUP_BENCHMARK(                                                           \
        buildGraph(Generator(static_cast<size_t>(State.range(0)))));          \
    for (auto _ : State) {                                                     \
      Body                                                                     \
    }                                                                          \
    State.SetComplexityN(                                                      \
        static_cast<std::int64_t>(State.counters["relationships"]));           \
  }                                                                            \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  BENCHMARK_REGISTER_F(Name, Kind) Args;

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define GENERATE_GENERATED_BENCHMARKS(Name, Generator, Args)                   \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  using Name = benchmark::Fixture;                                             \
  DEFINE_GENERATED_BENCHMARK(Name, expand, Generator, BENCHMARK_BODY_EXPAND,   \
                             Args)                                             \
  DEFINE_GENERATED_BENCHMARK(Name, expand_bfs, Generator,                      \
                             BENCHMARK_BODY_EXPAND_BFS, Args)                  \
  DEFINE_GENERATED_BENCHMARK(Name, spanning_tree, Generator,                   \
                             BENCHMARK_BODY_SPANNING_TREE, Args)               \
  DEFINE_GENERATED_BENCHMARK(Name, subgraph, Generator,                        \
                             BENCHMARK_BODY_SUBGRAPH, Args)                    \
  DEFINE_GENERATED_BENCHMARK(Name, shortest_paths, Generator,                  \
                             BENCHMARK_BODY_SHORTEST_PATHS, Args)

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define GENERATE_BENCHMARKS(Name, Builder)                                     \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                             \
  using Name = benchmark::Fixture;                                             \
  BENCHMARK_DEFINE_F(Name, expand)                                             \
  (benchmark::State & State) {                                                 \
    SETUP_BENCHMARK(Builder());                                                \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_EXPAND                                                    \
    }                                                                          \
  }                                                                            \
  BENCHMARK_REGISTER_F(Name, expand);                                          \
  BENCHMARK_DEFINE_F(Name, spanning_tree)                                      \
  (benchmark::State & State) {                                                 \
    SETUP_BENCHMARK(Builder());                                                \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_SPANNING_TREE                                             \
    }                                                                          \
  }                                                                            \
  BENCHMARK_REGISTER_F(Name, spanning_tree);                                   \
  BENCHMARK_DEFINE_F(Name, subgraph)                                           \
  (benchmark::State & State) {                                                 \
    SETUP_BENCHMARK(Builder());                                                \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_SUBGRAPH                                                  \
    }                                                                          \
  }                                                                            \
  BENCHMARK_REGISTER_F(Name, subgraph);                                        \
  BENCHMARK_DEFINE_F(Name, shortest_paths)                                     \
  (benchmark::State & State) {                                                 \
    SETUP_BENCHMARK(Builder());                                                \
    for (auto _ : State) {                                                     \
      BENCHMARK_BODY_SHORTEST_PATHS                                            \
    }                                                                          \
  }                                                                            \
  BENCHMARK_REGISTER_F(Name, shortest_paths);

#endif
