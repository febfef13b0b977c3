#include "traversal/subgraph.hpp"

#include <utility>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <spdlog/spdlog.h>

#include "traversal/label_filter.hpp"
#include "traversal/path_state.hpp"

std::vector<NodePtr> subgraphNodes(const GraphReadPort &Graph,
                                   const NodePtr &Start,
                                   const TraversalConfig &Conf) {
  auto Result = std::vector<NodePtr>{};
  if (!Start || Conf.hasEmptyLevelRange()) {
    return Result;
  }

  const auto Filter = LabelFilter::parse(Conf.LabelFilter);
  auto Queue = BreadthFirstQueue{Start};

  while (!Queue.empty()) {
    const auto [Vertex, Depth] = Queue.pop();

    if (Depth >= Conf.MinLevel) {
      Result.push_back(Vertex);
      if (Conf.isLimitReached(Result.size())) {
        break;
      }
    }

    if (Depth < Conf.MaxLevel) {
      if (auto Neighbors = valueOrSkip(
              Graph.getNodeNeighbors(Vertex->Id, Conf.RelationshipFilter,
                                     Direction::Both),
              "neighbors of node", Vertex->Id)) {
        for (auto &Neighbor : *Neighbors) {
          if (Filter.accepts(*Neighbor)) {
            Queue.pushIfUnvisited(std::move(Neighbor), Depth + 1);
          }
        }
      }
    }
  }

  spdlog::debug("subgraphNodes from {} reached {} nodes", *Start,
                Result.size());
  return Result;
}

Subgraph subgraphAll(const GraphReadPort &Graph, const NodePtr &Start,
                     const TraversalConfig &Conf) {
  auto Result = Subgraph{};
  if (!Start || Conf.hasEmptyLevelRange()) {
    return Result;
  }

  const auto Filter = LabelFilter::parse(Conf.LabelFilter);
  auto Queue = BreadthFirstQueue{Start};
  auto Collected = boost::container::flat_set<RelationshipId>{};

  const auto Collect = [&Result, &Collected](const RelationshipPtr &Rel) {
    if (Collected.insert(Rel->Id).second) {
      Result.Relationships.push_back(Rel);
    }
  };

  while (!Queue.empty()) {
    const auto [Vertex, Depth] = Queue.pop();

    if (Depth >= Conf.MinLevel) {
      Result.Nodes.push_back(Vertex);
    }

    if (Depth >= Conf.MaxLevel) {
      continue;
    }

    auto Relationships = valueOrSkip(
        Graph.getNodeRelationships(Vertex->Id, Conf.RelationshipFilter,
                                   Direction::Both),
        "relationships of node", Vertex->Id);
    if (!Relationships) {
      continue;
    }

    for (const auto &Rel : *Relationships) {
      const auto NeighborId = otherNode(*Rel, Vertex->Id);
      if (Queue.isVisited(NeighborId)) {
        Collect(Rel);
        continue;
      }

      auto Neighbor = valueOrSkip(Graph.getNode(NeighborId), "node",
                                  NeighborId);
      if (!Neighbor || !Filter.accepts(**Neighbor)) {
        continue;
      }
      Collect(Rel);
      Queue.pushIfUnvisited(std::move(*Neighbor), Depth + 1);
    }
  }

  spdlog::debug("subgraphAll from {} reached {} nodes and {} relationships",
                *Start, Result.Nodes.size(), Result.Relationships.size());
  return Result;
}
