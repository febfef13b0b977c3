#include "traversal/in_memory_graph.hpp"

#include <cstdint>
#include <memory>
#include <queue>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <fmt/core.h>
#include <range/v3/action/reverse.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <spdlog/spdlog.h>

#include "support/traversal_exception.hpp"
#include "traversal/relationship_filter.hpp"

namespace {
[[nodiscard]] ReadError nodeNotFound(const NodeId Id) {
  return ReadError{ReadError::KindType::NotFound,
                   fmt::format("node {} not found", Id)};
}

// Enumerates every simple path (no node twice) from a start node to a target
// node with at most MaxHops relationships.
class AllPathsCollector {
public:
  AllPathsCollector(const GraphReadPort &Graph,
                    const std::string_view RelFilter,
                    const NodeId EndId, const std::int64_t MaxHops)
      : Graph_(Graph),
        RelFilter_(RelFilter),
        EndId_(EndId),
        MaxHops_(MaxHops) {}

  void operator()(const Path &Current) {
    const auto &Tip = Current.getEndNode();
    if (Tip->Id == EndId_) {
      Paths_.push_back(Current);
      return;
    }
    if (static_cast<std::int64_t>(Current.getLength()) >= MaxHops_) {
      return;
    }

    auto Relationships = valueOrSkip(
        Graph_.getNodeRelationships(Tip->Id, RelFilter_,
                                    Direction::Both),
        "relationships of node", Tip->Id);
    if (!Relationships) {
      return;
    }
    for (const auto &Rel : *Relationships) {
      const auto NeighborId = otherNode(*Rel, Tip->Id);
      if (Current.containsNode(NeighborId)) {
        continue;
      }
      auto Neighbor = valueOrSkip(Graph_.getNode(NeighborId), "node",
                                  NeighborId);
      if (!Neighbor) {
        continue;
      }
      (*this)(Current.extend(Rel, std::move(*Neighbor)));
    }
  }

  [[nodiscard]] std::vector<Path> commit() { return std::move(Paths_); }

private:
  const GraphReadPort &Graph_;
  std::string_view RelFilter_;
  NodeId EndId_;
  std::int64_t MaxHops_;

  std::vector<Path> Paths_{};
};

struct ParentEntry {
  NodeId Previous{};
  RelationshipPtr Rel{};
};
} // namespace

NodeId InMemoryGraph::addNode(std::vector<std::string> Labels,
                              PropertyMap Properties) {
  const auto Id = NextNodeId_++;
  Nodes_.emplace(Id, std::make_shared<const Node>(
                         Node{Id, std::move(Labels), std::move(Properties)}));
  NodeRelationships_[Id];
  return Id;
}

RelationshipId InMemoryGraph::addRelationship(const NodeId StartId,
                                              const NodeId EndId,
                                              std::string Type,
                                              PropertyMap Properties) {
  TraversalException::verify(Nodes_.count(StartId) != 0U,
                             "Start node not found: {}", StartId);
  TraversalException::verify(Nodes_.count(EndId) != 0U,
                             "End node not found: {}", EndId);

  const auto Id = NextRelationshipId_++;
  auto Rel = std::make_shared<const Relationship>(Relationship{
      Id, std::move(Type), StartId, EndId, std::move(Properties)});
  NodeRelationships_[StartId].push_back(Rel);
  if (StartId != EndId) {
    NodeRelationships_[EndId].push_back(std::move(Rel));
  }
  ++NumRelationships_;
  return Id;
}

NodePtr InMemoryGraph::findNode(const NodeId Id) const {
  if (const auto Iter = Nodes_.find(Id); Iter != Nodes_.end()) {
    return Iter->second;
  }
  return nullptr;
}

std::vector<RelationshipPtr>
InMemoryGraph::getMatchingRelationships(const NodeId Id,
                                        const RelationshipFilter &Filter,
                                        const Direction Dir) const {
  const auto Iter = NodeRelationships_.find(Id);
  if (Iter == NodeRelationships_.end()) {
    return {};
  }
  return Iter->second |
         ranges::views::filter([&Filter, Id, Dir](const RelationshipPtr &Rel) {
           return Filter.matches(*Rel, Id, Dir);
         }) |
         ranges::to_vector;
}

ReadResult<NodePtr> InMemoryGraph::getNode(const NodeId Id) const {
  if (auto Found = findNode(Id)) {
    return Found;
  }
  return nodeNotFound(Id);
}

ReadResult<std::vector<RelationshipPtr>>
InMemoryGraph::getNodeRelationships(const NodeId Id,
                                    const std::string_view RelFilter,
                                    const Direction Dir) const {
  if (!findNode(Id)) {
    return nodeNotFound(Id);
  }
  return getMatchingRelationships(
      Id, RelationshipFilter::parse(RelFilter), Dir);
}

ReadResult<std::vector<NodePtr>>
InMemoryGraph::getNodeNeighbors(const NodeId Id,
                                const std::string_view RelFilter,
                                const Direction Dir) const {
  if (!findNode(Id)) {
    return nodeNotFound(Id);
  }

  auto Seen = boost::container::flat_set<NodeId>{};
  auto Neighbors = std::vector<NodePtr>{};
  for (const auto &Rel : getMatchingRelationships(
           Id, RelationshipFilter::parse(RelFilter), Dir)) {
    const auto NeighborId = otherNode(*Rel, Id);
    if (!Seen.insert(NeighborId).second) {
      continue;
    }
    if (auto Neighbor = findNode(NeighborId)) {
      Neighbors.push_back(std::move(Neighbor));
    }
  }
  return Neighbors;
}

ReadResult<Path>
InMemoryGraph::findShortestPath(const NodeId StartId, const NodeId EndId,
                                const std::string_view RelFilter,
                                const std::int64_t MaxHops) const {
  const auto Start = findNode(StartId);
  if (!Start) {
    return nodeNotFound(StartId);
  }
  if (!findNode(EndId)) {
    return nodeNotFound(EndId);
  }
  if (StartId == EndId) {
    return Path{Start};
  }

  const auto Filter = RelationshipFilter::parse(RelFilter);
  auto Parents = boost::container::flat_map<NodeId, ParentEntry>{};
  auto Visited = boost::container::flat_set<NodeId>{StartId};
  auto Queue = std::queue<std::pair<NodeId, std::int64_t>>{};
  Queue.emplace(StartId, 0);

  const auto Reconstruct = [this, &Parents, StartId, EndId]() {
    auto Nodes = std::vector<NodePtr>{};
    auto Relationships = std::vector<RelationshipPtr>{};
    for (auto Current = EndId; Current != StartId;) {
      const auto &Parent = Parents.at(Current);
      Nodes.push_back(findNode(Current));
      Relationships.push_back(Parent.Rel);
      Current = Parent.Previous;
    }
    Nodes.push_back(findNode(StartId));
    return Path{std::move(Nodes) | ranges::actions::reverse,
                std::move(Relationships) | ranges::actions::reverse};
  };

  while (!Queue.empty()) {
    const auto [Current, Depth] = Queue.front();
    Queue.pop();
    if (Depth >= MaxHops) {
      continue;
    }

    for (const auto &Rel : getMatchingRelationships(Current, Filter,
                                                    Direction::Both)) {
      const auto NeighborId = otherNode(*Rel, Current);
      if (!Visited.insert(NeighborId).second) {
        continue;
      }
      Parents.emplace(NeighborId, ParentEntry{Current, Rel});
      if (NeighborId == EndId) {
        return Reconstruct();
      }
      Queue.emplace(NeighborId, Depth + 1);
    }
  }

  spdlog::trace("no path between {} and {} within {} hops", StartId, EndId,
                MaxHops);
  return ReadError{ReadError::KindType::NotFound,
                   fmt::format("no path between {} and {}", StartId, EndId)};
}

ReadResult<std::vector<Path>>
InMemoryGraph::findAllPaths(const NodeId StartId, const NodeId EndId,
                            const std::string_view RelFilter,
                            const std::int64_t MaxHops) const {
  auto Start = findNode(StartId);
  if (!Start) {
    return nodeNotFound(StartId);
  }

  auto Collector = AllPathsCollector{*this, RelFilter, EndId, MaxHops};
  Collector(Path{std::move(Start)});
  return Collector.commit();
}
