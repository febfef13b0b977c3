#include "traversal/path_algebra.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <range/v3/action/push_back.hpp>
#include <range/v3/action/reverse.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/drop.hpp>
#include <range/v3/view/slice.hpp>

#include "support/ranges/functional.hpp"

Path combine(const std::vector<Path> &Paths) {
  auto Nodes = std::vector<NodePtr>{};
  auto Relationships = std::vector<RelationshipPtr>{};
  for (const auto &Val : Paths) {
    Nodes |= ranges::actions::push_back(Val.getNodes());
    Relationships |= ranges::actions::push_back(Val.getRelationships());
  }
  return Path{std::move(Nodes), std::move(Relationships)};
}

std::vector<PathElement> elements(const Path &Val) {
  const auto &Nodes = Val.getNodes();
  const auto &Relationships = Val.getRelationships();
  auto Result = std::vector<PathElement>{};
  Result.reserve(Nodes.size() + Relationships.size());
  for (std::size_t Index = 0U; Index < Nodes.size(); ++Index) {
    Result.emplace_back(Nodes[Index]);
    if (Index < Relationships.size()) {
      Result.emplace_back(Relationships[Index]);
    }
  }
  return Result;
}

Path slice(const Path &Val, std::int64_t Start, std::int64_t End) {
  const auto &Nodes = Val.getNodes();
  const auto &Relationships = Val.getRelationships();
  const auto NumNodes = static_cast<std::int64_t>(Nodes.size());
  const auto NumRelationships = static_cast<std::int64_t>(Relationships.size());

  Start = std::max(Start, std::int64_t{0});
  End = std::min(End, NumNodes);
  if (Start >= End) {
    return Path{};
  }

  auto SlicedRelationships = std::vector<RelationshipPtr>{};
  if (Start < NumRelationships) {
    const auto RelationshipEnd = std::min(End - 1, NumRelationships);
    SlicedRelationships =
        Relationships | ranges::views::slice(Start, RelationshipEnd) |
        ranges::to_vector;
  }
  return Path{Nodes | ranges::views::slice(Start, End) | ranges::to_vector,
              std::move(SlicedRelationships)};
}

Path reverse(const Path &Val) {
  return Path{Copy(Val.getNodes()) | ranges::actions::reverse,
              Copy(Val.getRelationships()) | ranges::actions::reverse};
}

std::vector<NodePtr> commonNodes(const std::vector<Path> &Paths) {
  if (Paths.empty()) {
    return {};
  }

  const auto IsInEveryPath = [&Paths](const NodeId Candidate) {
    return ranges::all_of(Paths | ranges::views::drop(1),
                          [Candidate](const Path &Other) {
                            return Other.containsNode(Candidate);
                          });
  };

  auto Seen = boost::container::flat_set<NodeId>{};
  auto Common = std::vector<NodePtr>{};
  for (const auto &Candidate : Paths.front().getNodes()) {
    if (Seen.insert(Candidate->Id).second && IsInEveryPath(Candidate->Id)) {
      Common.push_back(Candidate);
    }
  }
  return Common;
}
