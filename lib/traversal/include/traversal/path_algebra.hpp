#ifndef traversal_lib_traversal_include_traversal_path_algebra_hpp
#define traversal_lib_traversal_include_traversal_path_algebra_hpp

#include <cstdint>
#include <variant>
#include <vector>

#include "traversal/graph_types.hpp"

using PathElement = std::variant<NodePtr, RelationshipPtr>;

// Concatenates the nodes and relationships of Paths in order. The paths are
// not checked for connectivity and shared end nodes are not merged.
[[nodiscard]] Path combine(const std::vector<Path> &Paths);

// [node0, rel0, node1, rel1, ..., nodeN]
[[nodiscard]] std::vector<PathElement> elements(const Path &Val);

// The sub-path over the nodes [Start, End). Out of range bounds are clamped,
// an empty range gives an empty path.
[[nodiscard]] Path slice(const Path &Val, std::int64_t Start,
                         std::int64_t End);

[[nodiscard]] Path reverse(const Path &Val);

// nodes contained in every path, in the order of the first path
[[nodiscard]] std::vector<NodePtr> commonNodes(const std::vector<Path> &Paths);

#endif
