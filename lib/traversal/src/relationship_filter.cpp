#include "traversal/relationship_filter.hpp"

#include <string_view>

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <range/v3/algorithm/any_of.hpp>

namespace {
// whether Rel can be walked away from From under both direction constraints
[[nodiscard]] bool isTraversable(const Relationship &Rel, const NodeId From,
                                 const Direction Lhs, const Direction Rhs) {
  const auto AsOutgoing = Rel.StartNode == From &&
                          Lhs != Direction::Incoming &&
                          Rhs != Direction::Incoming;
  const auto AsIncoming = Rel.EndNode == From &&
                          Lhs != Direction::Outgoing &&
                          Rhs != Direction::Outgoing;
  return AsOutgoing || AsIncoming;
}
} // namespace

RelationshipFilter RelationshipFilter::parse(const std::string_view Filter) {
  auto Result = RelationshipFilter{};
  auto Parts = llvm::SmallVector<llvm::StringRef>{};
  llvm::StringRef{Filter.data(), Filter.size()}.split(Parts, '|', -1, false);
  for (auto Part : Parts) {
    Part = Part.trim();
    auto Dir = Direction::Both;
    if (Part.consume_front("<")) {
      Dir = Direction::Incoming;
    } else if (Part.consume_back(">")) {
      Dir = Direction::Outgoing;
    }
    Result.Entries_.push_back(Entry{Part.trim().str(), Dir});
  }
  return Result;
}

bool RelationshipFilter::matches(const Relationship &Rel, const NodeId From,
                                 const Direction Dir) const {
  if (Entries_.empty()) {
    return isTraversable(Rel, From, Dir, Direction::Both);
  }
  return ranges::any_of(Entries_, [&Rel, From, Dir](const Entry &Val) {
    return (Val.Type.empty() || Val.Type == Rel.Type) &&
           isTraversable(Rel, From, Dir, Val.Dir);
  });
}
