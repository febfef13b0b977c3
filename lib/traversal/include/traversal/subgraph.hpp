#ifndef traversal_lib_traversal_include_traversal_subgraph_hpp
#define traversal_lib_traversal_include_traversal_subgraph_hpp

#include <vector>

#include "traversal/config.hpp"
#include "traversal/graph_read_port.hpp"
#include "traversal/graph_types.hpp"

struct Subgraph {
  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  std::vector<NodePtr> Nodes{};
  std::vector<RelationshipPtr> Relationships{};
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

// Nodes reachable from Start whose shortest-hop distance lies in
// [MinLevel, MaxLevel], in breadth-first order. Stops after Limit nodes.
[[nodiscard]] std::vector<NodePtr> subgraphNodes(const GraphReadPort &Graph,
                                                 const NodePtr &Start,
                                                 const TraversalConfig &Conf);

// Like subgraphNodes, additionally collects every relationship walked while
// expanding the nodes closer than MaxLevel. Relationships into nodes that
// were already discovered are collected as well, each relationship once.
// Limit is not applied.
[[nodiscard]] Subgraph subgraphAll(const GraphReadPort &Graph,
                                   const NodePtr &Start,
                                   const TraversalConfig &Conf);

#endif
