#include "traversal/graph_types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>

#include "support/ranges/functional.hpp"

bool Node::hasLabel(const std::string_view Label) const {
  return ranges::any_of(Labels,
                        [Label](const std::string &Val) { return Val == Label; });
}

Path::Path(NodePtr Start) : Nodes_{std::move(Start)} {}

Path::Path(std::vector<NodePtr> Nodes,
           std::vector<RelationshipPtr> Relationships)
    : Nodes_(std::move(Nodes)),
      Relationships_(std::move(Relationships)) {}

bool Path::containsNode(const NodeId Id) const {
  return ranges::any_of(Nodes_, EqualTo(Id),
                        [](const NodePtr &Val) { return Val->Id; });
}

bool Path::containsRelationship(const RelationshipId Id) const {
  return ranges::any_of(Relationships_, EqualTo(Id),
                        [](const RelationshipPtr &Val) { return Val->Id; });
}

Path Path::extend(RelationshipPtr Rel, NodePtr Next) const {
  auto Extended = *this;
  Extended.Relationships_.emplace_back(std::move(Rel));
  Extended.Nodes_.emplace_back(std::move(Next));
  return Extended;
}

fmt::format_context::iterator
fmt::formatter<Path>::format(const Path &Val, format_context &Ctx) const {
  const auto &Nodes = Val.getNodes();
  const auto &Relationships = Val.getRelationships();
  auto Out = Ctx.out();
  for (std::size_t Index = 0U; Index < Nodes.size(); ++Index) {
    Out = fmt::format_to(Out, "{}", *Nodes[Index]);
    if (Index >= Relationships.size() || Index + 1U == Nodes.size()) {
      continue;
    }
    const auto &Rel = *Relationships[Index];
    if (Rel.StartNode == Nodes[Index]->Id) {
      Out = fmt::format_to(Out, "-[{}:{}]->", Rel.Id, Rel.Type);
    } else {
      Out = fmt::format_to(Out, "<-[{}:{}]-", Rel.Id, Rel.Type);
    }
  }
  return Out;
}
