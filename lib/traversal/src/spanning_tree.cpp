#include "traversal/spanning_tree.hpp"

#include <cstdint>
#include <queue>
#include <utility>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <spdlog/spdlog.h>

#include "traversal/label_filter.hpp"

std::vector<Path> spanningTree(const GraphReadPort &Graph,
                               const NodePtr &Start,
                               const TraversalConfig &Conf) {
  auto Paths = std::vector<Path>{};
  if (!Start || Conf.hasEmptyLevelRange()) {
    return Paths;
  }

  const auto Filter = LabelFilter::parse(Conf.LabelFilter);
  auto Visited = boost::container::flat_set<NodeId>{Start->Id};
  auto Queue = std::queue<Path>{};
  Queue.emplace(Start);

  while (!Queue.empty() && !Conf.isLimitReached(Paths.size())) {
    const auto Current = std::move(Queue.front());
    Queue.pop();

    const auto Depth = static_cast<std::int64_t>(Current.getLength());
    if (Depth >= Conf.MaxLevel) {
      continue;
    }

    const auto &Tip = Current.getEndNode();
    auto Relationships = valueOrSkip(
        Graph.getNodeRelationships(Tip->Id, Conf.RelationshipFilter,
                                   Direction::Both),
        "relationships of node", Tip->Id);
    if (!Relationships) {
      continue;
    }

    for (const auto &Rel : *Relationships) {
      const auto NeighborId = otherNode(*Rel, Tip->Id);
      if (Visited.count(NeighborId) != 0U) {
        continue;
      }
      auto Neighbor = valueOrSkip(Graph.getNode(NeighborId), "node",
                                  NeighborId);
      if (!Neighbor || !Filter.accepts(**Neighbor)) {
        continue;
      }
      Visited.insert(NeighborId);

      auto Next = Current.extend(Rel, std::move(*Neighbor));
      if (Depth + 1 >= Conf.MinLevel) {
        Paths.push_back(Next);
        if (Conf.isLimitReached(Paths.size())) {
          break;
        }
      }
      Queue.push(std::move(Next));
    }
  }

  spdlog::debug("spanningTree from {} reached {} nodes", *Start, Paths.size());
  return Paths;
}
