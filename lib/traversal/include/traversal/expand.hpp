#ifndef traversal_lib_traversal_include_traversal_expand_hpp
#define traversal_lib_traversal_include_traversal_expand_hpp

#include <vector>

#include "traversal/config.hpp"
#include "traversal/graph_read_port.hpp"
#include "traversal/graph_types.hpp"

// Every walk from Start with a length in [MinLevel, MaxLevel] that satisfies
// the relationship filter, the label filter and the uniqueness policy. Each
// valid prefix is a result on its own, not only the maximal walks. At most
// Limit paths are returned.
//
// The walk is depth-first and the paths are returned in pre-order. With
// Conf.Bfs the same paths are produced breadth-first, ordered by length.
[[nodiscard]] std::vector<Path> expandConfig(const GraphReadPort &Graph,
                                             const NodePtr &Start,
                                             const TraversalConfig &Conf);

#endif
