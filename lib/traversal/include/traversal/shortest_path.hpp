#ifndef traversal_lib_traversal_include_traversal_shortest_path_hpp
#define traversal_lib_traversal_include_traversal_shortest_path_hpp

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "traversal/graph_read_port.hpp"
#include "traversal/graph_types.hpp"

// The path search itself is done by the graph port, these functions only
// post-process its results. Port errors are reported as "no path".

[[nodiscard]] std::optional<Path> shortestPath(const GraphReadPort &Graph,
                                               const NodePtr &Start,
                                               const NodePtr &End,
                                               std::string_view RelFilter,
                                               std::int64_t MaxHops);

// all paths of minimal length among the paths with at most MaxHops
// relationships
[[nodiscard]] std::vector<Path> allShortestPaths(const GraphReadPort &Graph,
                                                 const NodePtr &Start,
                                                 const NodePtr &End,
                                                 std::string_view RelFilter,
                                                 std::int64_t MaxHops);

[[nodiscard]] std::optional<std::size_t> distance(const GraphReadPort &Graph,
                                                  const NodePtr &Start,
                                                  const NodePtr &End,
                                                  std::string_view RelFilter,
                                                  std::int64_t MaxHops);

// all paths of maximal length among the paths with at most MaxHops
// relationships
[[nodiscard]] std::vector<Path> longestPaths(const GraphReadPort &Graph,
                                             const NodePtr &Start,
                                             const NodePtr &End,
                                             std::string_view RelFilter,
                                             std::int64_t MaxHops);

// the K shortest paths, ties keep the order of the port; empty for K <= 0
[[nodiscard]] std::vector<Path> kShortestPaths(const GraphReadPort &Graph,
                                               const NodePtr &Start,
                                               const NodePtr &End,
                                               std::string_view RelFilter,
                                               std::int64_t MaxHops,
                                               std::int64_t K);

[[nodiscard]] std::vector<Path> pathsWithLength(const GraphReadPort &Graph,
                                                const NodePtr &Start,
                                                const NodePtr &End,
                                                std::string_view RelFilter,
                                                std::int64_t Length);

// paths with MinLength <= length <= MaxLength
[[nodiscard]] std::vector<Path> pathsWithinLength(const GraphReadPort &Graph,
                                                  const NodePtr &Start,
                                                  const NodePtr &End,
                                                  std::string_view RelFilter,
                                                  std::int64_t MinLength,
                                                  std::int64_t MaxLength);

[[nodiscard]] std::size_t countPaths(const GraphReadPort &Graph,
                                     const NodePtr &Start, const NodePtr &End,
                                     std::string_view RelFilter,
                                     std::int64_t MaxHops);

[[nodiscard]] bool pathExists(const GraphReadPort &Graph, const NodePtr &Start,
                              const NodePtr &End, std::string_view RelFilter,
                              std::int64_t MaxHops);

#endif
