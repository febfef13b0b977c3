#ifndef traversal_lib_traversal_include_traversal_path_state_hpp
#define traversal_lib_traversal_include_traversal_path_state_hpp

#include <cstdint>
#include <queue>
#include <utility>

#include <boost/container/flat_set.hpp>

#include "traversal/graph_types.hpp"

struct PathState {
  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  NodePtr Vertex{};
  std::int64_t Depth{};
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

// FIFO worklist for the breadth-first traversals. A node is marked as
// visited when it is pushed, so every node is pushed at most once and its
// depth is the length of the shortest path to it.
class BreadthFirstQueue {
public:
  explicit BreadthFirstQueue(NodePtr Start) {
    pushIfUnvisited(std::move(Start), 0);
  }

  [[nodiscard]] bool empty() const { return Queue_.empty(); }

  [[nodiscard]] PathState pop() {
    auto State = std::move(Queue_.front());
    Queue_.pop();
    return State;
  }

  bool pushIfUnvisited(NodePtr Vertex, const std::int64_t Depth) {
    if (!Visited_.insert(Vertex->Id).second) {
      return false;
    }
    Queue_.push(PathState{std::move(Vertex), Depth});
    return true;
  }

  [[nodiscard]] bool isVisited(const NodeId Id) const {
    return Visited_.count(Id) != 0U;
  }

private:
  std::queue<PathState> Queue_{};
  boost::container::flat_set<NodeId> Visited_{};
};

#endif
