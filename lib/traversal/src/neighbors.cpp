#include "traversal/neighbors.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include "support/ranges/functional.hpp"
#include "traversal/path_state.hpp"

namespace {
// breadth-first levels 0..Hops of Start, each node with its distance
[[nodiscard]] std::vector<PathState>
collectLevels(const GraphReadPort &Graph, const NodePtr &Start,
              const std::string_view RelFilter, const std::int64_t Hops) {
  auto Levels = std::vector<PathState>{};
  auto Queue = BreadthFirstQueue{Start};
  while (!Queue.empty()) {
    auto State = Queue.pop();
    if (State.Depth < Hops) {
      if (auto Neighbors = valueOrSkip(
              Graph.getNodeNeighbors(State.Vertex->Id, RelFilter,
                                     Direction::Both),
              "neighbors of node", State.Vertex->Id)) {
        for (auto &Neighbor : *Neighbors) {
          Queue.pushIfUnvisited(std::move(Neighbor), State.Depth + 1);
        }
      }
    }
    Levels.push_back(std::move(State));
  }
  return Levels;
}

class DepthFirstCollector {
public:
  DepthFirstCollector(const GraphReadPort &Graph,
                      const std::string_view RelFilter,
                      const std::int64_t MaxDepth)
      : Graph_(Graph),
        RelFilter_(RelFilter),
        MaxDepth_(MaxDepth) {}

  // a node is marked when it is visited, a node first seen beyond MaxDepth
  // stays reachable through a shorter branch
  void operator()(const NodePtr &Vertex, const std::int64_t Depth) {
    if (Depth > MaxDepth_ || !Visited_.insert(Vertex->Id).second) {
      return;
    }
    Nodes_.push_back(Vertex);

    if (auto Neighbors = valueOrSkip(
            Graph_.getNodeNeighbors(Vertex->Id, RelFilter_, Direction::Both),
            "neighbors of node", Vertex->Id)) {
      for (const auto &Neighbor : *Neighbors) {
        (*this)(Neighbor, Depth + 1);
      }
    }
  }

  [[nodiscard]] std::vector<NodePtr> commit() { return std::move(Nodes_); }

private:
  const GraphReadPort &Graph_;
  std::string_view RelFilter_;
  std::int64_t MaxDepth_;

  boost::container::flat_set<NodeId> Visited_{};
  std::vector<NodePtr> Nodes_{};
};

[[nodiscard]] std::vector<NodePtr>
toNodes(const std::vector<PathState> &Levels, auto Predicate) {
  return Levels | ranges::views::filter(Predicate, &PathState::Depth) |
         ranges::views::transform(&PathState::Vertex) |
         ranges::to<std::vector<NodePtr>>;
}
} // namespace

std::vector<NodePtr> neighborsAtHop(const GraphReadPort &Graph,
                                    const NodePtr &Start,
                                    const std::string_view RelFilter,
                                    const std::int64_t Hops) {
  if (!Start) {
    return {};
  }
  if (Hops <= 0) {
    return {Start};
  }
  return toNodes(collectLevels(Graph, Start, RelFilter, Hops), EqualTo(Hops));
}

std::vector<NodePtr> neighborsToHop(const GraphReadPort &Graph,
                                    const NodePtr &Start,
                                    const std::string_view RelFilter,
                                    const std::int64_t Hops) {
  if (!Start) {
    return {};
  }
  return toNodes(collectLevels(Graph, Start, RelFilter, Hops),
                 NotEqualTo(std::int64_t{0}));
}

std::size_t countNeighborsAtHop(const GraphReadPort &Graph,
                                const NodePtr &Start,
                                const std::string_view RelFilter,
                                const std::int64_t Hops) {
  return neighborsAtHop(Graph, Start, RelFilter, Hops).size();
}

bool hasNeighborsAtHop(const GraphReadPort &Graph, const NodePtr &Start,
                       const std::string_view RelFilter,
                       const std::int64_t Hops) {
  return countNeighborsAtHop(Graph, Start, RelFilter, Hops) != 0U;
}

std::vector<NodePtr> neighborsDepthFirst(const GraphReadPort &Graph,
                                         const NodePtr &Start,
                                         const std::string_view RelFilter,
                                         const std::int64_t MaxDepth) {
  if (!Start) {
    return {};
  }
  auto Collector = DepthFirstCollector{Graph, RelFilter, MaxDepth};
  Collector(Start, 0);
  return Collector.commit();
}
