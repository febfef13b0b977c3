#include "traversal/expand.hpp"

#include <cstdint>
#include <queue>
#include <utility>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <spdlog/spdlog.h>

#include "traversal/label_filter.hpp"

namespace {
class PathExpander {
public:
  PathExpander(const GraphReadPort &Graph, const TraversalConfig &Conf)
      : Graph_(Graph),
        Conf_(Conf),
        Unique_(Conf.getEffectiveUniqueness()),
        Filter_(LabelFilter::parse(Conf.LabelFilter)) {}

  void depthFirst(const NodePtr &Start) {
    OnBranch_.insert(Start->Id);
    walk(Path{Start});
  }

  void breadthFirst(const NodePtr &Start) {
    auto Queue = std::queue<Path>{};
    Queue.emplace(Start);

    while (!Queue.empty()) {
      const auto Current = std::move(Queue.front());
      Queue.pop();

      if (!emit(Current)) {
        return;
      }
      if (getDepth(Current) >= Conf_.MaxLevel) {
        continue;
      }
      forEachStep(Current, [&Queue](Path Next) { Queue.push(std::move(Next)); });
    }
  }

  [[nodiscard]] std::vector<Path> commit() { return std::move(Paths_); }

private:
  [[nodiscard]] static std::int64_t getDepth(const Path &Current) {
    return static_cast<std::int64_t>(Current.getLength());
  }

  [[nodiscard]] bool isLimitReached() const {
    return Conf_.isLimitReached(Paths_.size());
  }

  // records Current if it is long enough, returns false once the limit is
  // reached
  [[nodiscard]] bool emit(const Path &Current) {
    if (isLimitReached()) {
      return false;
    }
    if (getDepth(Current) >= Conf_.MinLevel) {
      Paths_.push_back(Current);
    }
    return !isLimitReached();
  }

  [[nodiscard]] bool isUnique(const Path &Current, const Relationship &Rel,
                              const NodeId NeighborId) const {
    switch (Unique_) {
    case Uniqueness::NodeGlobal:
      return Conf_.Bfs ? !Current.containsNode(NeighborId)
                       : OnBranch_.count(NeighborId) == 0U;
    case Uniqueness::RelationshipPath:
      return !Current.containsRelationship(Rel.Id);
    case Uniqueness::None:
      return true;
    }
    return true;
  }

  // invokes Step with every admissible one-relationship extension of Current
  template <typename StepFn> void forEachStep(const Path &Current, StepFn Step) {
    const auto &Tip = Current.getEndNode();
    auto Relationships = valueOrSkip(
        Graph_.getNodeRelationships(Tip->Id, Conf_.RelationshipFilter,
                                    Direction::Both),
        "relationships of node", Tip->Id);
    if (!Relationships) {
      return;
    }

    for (const auto &Rel : *Relationships) {
      if (isLimitReached()) {
        return;
      }
      const auto NeighborId = otherNode(*Rel, Tip->Id);
      if (!isUnique(Current, *Rel, NeighborId)) {
        continue;
      }
      auto Neighbor = valueOrSkip(Graph_.getNode(NeighborId), "node",
                                  NeighborId);
      if (!Neighbor || !Filter_.accepts(**Neighbor)) {
        continue;
      }
      Step(Current.extend(Rel, std::move(*Neighbor)));
    }
  }

  void walk(const Path &Current) {
    if (!emit(Current) || getDepth(Current) >= Conf_.MaxLevel) {
      return;
    }

    forEachStep(Current, [this](const Path &Next) {
      const auto NeighborId = Next.getEndNode()->Id;
      const auto Marks = Unique_ == Uniqueness::NodeGlobal;
      if (Marks) {
        OnBranch_.insert(NeighborId);
      }
      walk(Next);
      if (Marks) {
        OnBranch_.erase(NeighborId);
      }
    });
  }

  const GraphReadPort &Graph_;
  const TraversalConfig &Conf_;
  Uniqueness Unique_;
  LabelFilter Filter_;

  // nodes on the branch currently being walked (NodeGlobal, depth-first)
  boost::container::flat_set<NodeId> OnBranch_{};
  std::vector<Path> Paths_{};
};
} // namespace

std::vector<Path> expandConfig(const GraphReadPort &Graph,
                               const NodePtr &Start,
                               const TraversalConfig &Conf) {
  if (!Start || Conf.hasEmptyLevelRange()) {
    return {};
  }

  if (Conf.getEffectiveUniqueness() != Conf.Unique) {
    spdlog::debug("expandConfig: unbounded {} walk uses {} uniqueness",
                  Conf.Unique, Conf.getEffectiveUniqueness());
  }

  auto Expander = PathExpander{Graph, Conf};
  if (Conf.Bfs) {
    Expander.breadthFirst(Start);
  } else {
    Expander.depthFirst(Start);
  }
  auto Paths = Expander.commit();
  spdlog::debug("expandConfig from {} ({}) produced {} paths", *Start,
                Conf.Bfs ? "breadth-first" : "depth-first", Paths.size());
  return Paths;
}
