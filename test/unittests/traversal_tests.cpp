#include "traversal_tests.hpp"

#include <cstdint>
#include <functional>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/indices.hpp>
#include <range/v3/view/set_algorithm.hpp>
#include <range/v3/view/transform.hpp>

namespace {
constexpr auto Indentation = 14U;

[[nodiscard]] std::string toString(const std::source_location &Loc) {
  return fmt::format("Source: {}:{}:{}", Loc.file_name(), Loc.line(),
                     Loc.column());
}

[[nodiscard]] ReadError ioError(const NodeId Id) {
  return ReadError{ReadError::KindType::Io,
                   fmt::format("node {} is unavailable", Id)};
}

[[nodiscard]] bool touchesAny(const Path &Val, const auto &IsFailing) {
  for (const auto &Vertex : Val.getNodes()) {
    if (IsFailing(Vertex->Id)) {
      return true;
    }
  }
  return false;
}
} // namespace

NodeId NamedGraph::add(const std::string_view Name,
                       std::vector<std::string> Labels) {
  const auto Id = Graph_.addNode(
      std::move(Labels), PropertyMap{{"name", std::string{Name}}});
  Ids_.emplace(std::string{Name}, Id);
  return Id;
}

RelationshipId NamedGraph::connect(const std::string_view From,
                                   const std::string_view To,
                                   std::string Type) {
  const auto GetOrAdd = [this](const std::string_view Name) {
    if (const auto Iter = Ids_.find(Name); Iter != Ids_.end()) {
      return Iter->second;
    }
    return add(Name);
  };
  const auto FromId = GetOrAdd(From);
  const auto ToId = GetOrAdd(To);
  return Graph_.addRelationship(FromId, ToId, std::move(Type));
}

NodeId NamedGraph::getId(const std::string_view Name) const {
  const auto Iter = Ids_.find(Name);
  REQUIRE(Iter != Ids_.end());
  return Iter->second;
}

NodePtr NamedGraph::node(const std::string_view Name) const {
  auto Result = Graph_.getNode(getId(Name));
  REQUIRE(std::holds_alternative<NodePtr>(Result));
  return std::get<NodePtr>(std::move(Result));
}

NamedGraph buildChain(const std::string_view Type) {
  auto Graph = NamedGraph{};
  Graph.connect("A", "B", std::string{Type});
  Graph.connect("B", "C", std::string{Type});
  Graph.connect("C", "D", std::string{Type});
  return Graph;
}

NamedGraph buildDiamond() {
  auto Graph = NamedGraph{};
  Graph.connect("A", "B");
  Graph.connect("A", "C");
  Graph.connect("B", "D");
  Graph.connect("C", "D");
  return Graph;
}

NamedGraph buildTriangle() {
  auto Graph = NamedGraph{};
  Graph.connect("A", "B");
  Graph.connect("B", "C");
  Graph.connect("C", "A");
  return Graph;
}

NamedGraph buildGraph(const GeneratedGraph &Generated) {
  auto Graph = NamedGraph{};
  for (const auto Index : ranges::views::indices(Generated.NumNodes)) {
    std::ignore = Graph.add(fmt::format("{}", Index));
  }
  for (const auto &Edge : Generated.Edges) {
    Graph.connect(fmt::format("{}", Edge.Start), fmt::format("{}", Edge.End),
                  Edge.Type);
  }
  return Graph;
}

bool FailingGraph::isFailing(const NodeId Id) const {
  return FailingNodes_.count(Id) != 0U;
}

ReadResult<NodePtr> FailingGraph::getNode(const NodeId Id) const {
  if (isFailing(Id)) {
    return ioError(Id);
  }
  return Graph_.getNode(Id);
}

ReadResult<std::vector<NodePtr>>
FailingGraph::getNodeNeighbors(const NodeId Id,
                               const std::string_view RelFilter,
                               const Direction Dir) const {
  ++NumNeighborReads_;
  if (isFailing(Id)) {
    return ioError(Id);
  }
  return Graph_.getNodeNeighbors(Id, RelFilter, Dir);
}

ReadResult<std::vector<RelationshipPtr>>
FailingGraph::getNodeRelationships(const NodeId Id,
                                   const std::string_view RelFilter,
                                   const Direction Dir) const {
  if (isFailing(Id)) {
    return ioError(Id);
  }
  return Graph_.getNodeRelationships(Id, RelFilter, Dir);
}

ReadResult<Path> FailingGraph::findShortestPath(
    const NodeId StartId, const NodeId EndId,
    const std::string_view RelFilter, const std::int64_t MaxHops) const {
  auto Result = Graph_.findShortestPath(StartId, EndId, RelFilter, MaxHops);
  if (const auto *const Found = std::get_if<Path>(&Result);
      Found != nullptr &&
      touchesAny(*Found, [this](const NodeId Id) { return isFailing(Id); })) {
    return ioError(StartId);
  }
  return Result;
}

ReadResult<std::vector<Path>> FailingGraph::findAllPaths(
    const NodeId StartId, const NodeId EndId,
    const std::string_view RelFilter, const std::int64_t MaxHops) const {
  if (isFailing(StartId) || isFailing(EndId)) {
    return ioError(StartId);
  }
  return Graph_.findAllPaths(StartId, EndId, RelFilter, MaxHops);
}

std::string getName(const Node &Val) {
  const auto Iter = Val.Properties.find("name");
  if (Iter == Val.Properties.end()) {
    return fmt::format("{}", Val.Id);
  }
  if (const auto *const Name = std::get_if<std::string>(&Iter->second)) {
    return *Name;
  }
  return fmt::format("{}", Val.Id);
}

std::string toString(const Path &Val) {
  return fmt::format("{}", fmt::join(Val.getNodes() |
                                         ranges::views::transform(
                                             [](const NodePtr &Vertex) {
                                               return getName(*Vertex);
                                             }),
                                     "-"));
}

std::vector<std::string> toStrings(const std::vector<Path> &Paths) {
  return Paths |
         ranges::views::transform([](const Path &Val) { return toString(Val); }) |
         ranges::to<std::vector>;
}

std::vector<std::string> toNames(const std::vector<NodePtr> &Nodes) {
  return Nodes | ranges::views::transform([](const NodePtr &Vertex) {
           return getName(*Vertex);
         }) |
         ranges::to<std::vector>;
}

void verify(const std::vector<Path> &Paths, const ResultPaths &ExpectedPaths,
            const std::source_location Loc) {
  INFO(toString(Loc));
  const auto FoundPaths = toStrings(Paths) | ranges::to<ResultPaths>;

  const auto ToSetDifference = [](const ResultPaths &Lhs,
                                  const ResultPaths &Rhs) {
    return ranges::views::set_difference(Lhs, Rhs) | ranges::to<ResultPaths>;
  };
  static const auto Seperator = fmt::format("\n{0: <{1}}  ", "", Indentation);
  INFO(fmt::format(
      "{1: <{0}}: {2}\n"
      "{3: <{0}}: {4}\n"
      "{5: <{0}}: {6}\n"
      "{7: <{0}}: {8}\n",
      Indentation, "Expected", fmt::join(ExpectedPaths, Seperator), "Found",
      fmt::join(toStrings(Paths), Seperator), "Not found",
      fmt::join(ToSetDifference(ExpectedPaths, FoundPaths), Seperator),
      "Not expected",
      fmt::join(ToSetDifference(FoundPaths, ExpectedPaths), Seperator)));

  REQUIRE(FoundPaths.size() == Paths.size());
  REQUIRE(ranges::equal(FoundPaths, ExpectedPaths));
}

void verify(const std::vector<NodePtr> &Nodes,
            const std::vector<std::string> &ExpectedNames,
            const std::source_location Loc) {
  INFO(toString(Loc));
  const auto FoundNames = toNames(Nodes);
  INFO(fmt::format("{1: <{0}}: {2}\n{3: <{0}}: {4}", Indentation, "Expected",
                   fmt::join(ExpectedNames, ", "), "Found",
                   fmt::join(FoundNames, ", ")));
  REQUIRE(FoundNames == ExpectedNames);
}
