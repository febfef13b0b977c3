#ifndef traversal_lib_traversal_include_traversal_neighbors_hpp
#define traversal_lib_traversal_include_traversal_neighbors_hpp

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "traversal/graph_read_port.hpp"
#include "traversal/graph_types.hpp"

// nodes whose shortest-hop distance to Start is exactly Hops, {Start} for
// Hops <= 0
[[nodiscard]] std::vector<NodePtr> neighborsAtHop(const GraphReadPort &Graph,
                                                  const NodePtr &Start,
                                                  std::string_view RelFilter,
                                                  std::int64_t Hops);

// nodes within 1..Hops hops of Start in breadth-first order, Start excluded
[[nodiscard]] std::vector<NodePtr> neighborsToHop(const GraphReadPort &Graph,
                                                  const NodePtr &Start,
                                                  std::string_view RelFilter,
                                                  std::int64_t Hops);

[[nodiscard]] std::size_t countNeighborsAtHop(const GraphReadPort &Graph,
                                              const NodePtr &Start,
                                              std::string_view RelFilter,
                                              std::int64_t Hops);

[[nodiscard]] bool hasNeighborsAtHop(const GraphReadPort &Graph,
                                     const NodePtr &Start,
                                     std::string_view RelFilter,
                                     std::int64_t Hops);

// nodes within MaxDepth hops of Start in depth-first pre-order, Start first;
// empty for MaxDepth < 0
[[nodiscard]] std::vector<NodePtr>
neighborsDepthFirst(const GraphReadPort &Graph, const NodePtr &Start,
                    std::string_view RelFilter, std::int64_t MaxDepth);

#endif
