#ifndef traversal_lib_traversal_include_traversal_spanning_tree_hpp
#define traversal_lib_traversal_include_traversal_spanning_tree_hpp

#include <vector>

#include "traversal/config.hpp"
#include "traversal/graph_read_port.hpp"
#include "traversal/graph_types.hpp"

// Breadth-first spanning tree rooted at Start: one path for every node first
// discovered at a depth in [max(1, MinLevel), MaxLevel], ordered by length.
// Conf.Unique and Conf.Bfs are ignored, nodes are never revisited.
[[nodiscard]] std::vector<Path> spanningTree(const GraphReadPort &Graph,
                                             const NodePtr &Start,
                                             const TraversalConfig &Conf);

#endif
