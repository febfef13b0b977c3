#ifndef traversal_lib_traversal_include_traversal_graph_types_hpp
#define traversal_lib_traversal_include_traversal_graph_types_hpp

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

using NodeId = std::int64_t;
using RelationshipId = std::int64_t;

using PropertyValue =
    std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using PropertyMap = std::map<std::string, PropertyValue, std::less<>>;

struct Node {
  [[nodiscard]] bool hasLabel(std::string_view Label) const;

  [[nodiscard]] friend bool operator==(const Node &, const Node &) = default;

  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  NodeId Id{};
  std::vector<std::string> Labels{};
  PropertyMap Properties{};
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

struct Relationship {
  [[nodiscard]] friend bool operator==(const Relationship &,
                                       const Relationship &) = default;

  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  RelationshipId Id{};
  std::string Type{};
  NodeId StartNode{};
  NodeId EndNode{};
  PropertyMap Properties{};
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

// the storage layer owns the entities, traversals only hold shared handles
using NodePtr = std::shared_ptr<const Node>;
using RelationshipPtr = std::shared_ptr<const Relationship>;

// Resolves the neighbor of CurrentNode across Rel, independent of the
// relationship direction. A self loop resolves to CurrentNode.
[[nodiscard]] constexpr NodeId otherNode(const Relationship &Rel,
                                         const NodeId CurrentNode) {
  return Rel.StartNode == CurrentNode ? Rel.EndNode : Rel.StartNode;
}

// An immutable walk through the graph. Relationships[I] connects Nodes[I]
// and Nodes[I + 1] in either direction. Paths produced by traversals always
// satisfy Nodes.size() == Relationships.size() + 1, the algebra functions
// may produce paths that do not (e.g. combine).
class Path {
public:
  Path() = default;
  explicit Path(NodePtr Start);
  Path(std::vector<NodePtr> Nodes, std::vector<RelationshipPtr> Relationships);

  [[nodiscard]] const std::vector<NodePtr> &getNodes() const { return Nodes_; }

  [[nodiscard]] const std::vector<RelationshipPtr> &getRelationships() const {
    return Relationships_;
  }

  [[nodiscard]] std::size_t getLength() const { return Relationships_.size(); }

  [[nodiscard]] bool empty() const { return Nodes_.empty(); }

  [[nodiscard]] const NodePtr &getStartNode() const { return Nodes_.front(); }
  [[nodiscard]] const NodePtr &getEndNode() const { return Nodes_.back(); }

  [[nodiscard]] bool containsNode(NodeId Id) const;
  [[nodiscard]] bool containsRelationship(RelationshipId Id) const;

  // returns a new path with Rel and Next appended
  [[nodiscard]] Path extend(RelationshipPtr Rel, NodePtr Next) const;

private:
  std::vector<NodePtr> Nodes_{};
  std::vector<RelationshipPtr> Relationships_{};
};

template <> class fmt::formatter<Node> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Node &Val,
                                                format_context &Ctx) const {
    if (Val.Labels.empty()) {
      return fmt::format_to(Ctx.out(), "({})", Val.Id);
    }
    return fmt::format_to(Ctx.out(), "({}:{})", Val.Id,
                          fmt::join(Val.Labels, ":"));
  }
};

template <> class fmt::formatter<Relationship> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Relationship &Val,
                                                format_context &Ctx) const {
    return fmt::format_to(Ctx.out(), "[{}:{} {}->{}]", Val.Id, Val.Type,
                          Val.StartNode, Val.EndNode);
  }
};

// (1:Person)-[7:KNOWS]->(2:Person)<-[8:LIKES]-(3)
template <> class fmt::formatter<Path> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Path &Val,
                                                format_context &Ctx) const;
};

#endif
