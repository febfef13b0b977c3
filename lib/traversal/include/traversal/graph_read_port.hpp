#ifndef traversal_lib_traversal_include_traversal_graph_read_port_hpp
#define traversal_lib_traversal_include_traversal_graph_read_port_hpp

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "traversal/graph_types.hpp"

enum class Direction { Outgoing, Incoming, Both };

struct ReadError {
  enum class KindType { NotFound, Io };

  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  KindType Kind{KindType::NotFound};
  std::string Message{};
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

template <typename T> using ReadResult = std::variant<T, ReadError>;

// Read-only capability the traversals are written against. Implementations
// report unknown ids as ReadError::KindType::NotFound. The traversals never
// mutate the graph, so an implementation that is safe for concurrent reads
// makes every traversal safe to call concurrently.
class GraphReadPort {
public:
  GraphReadPort() = default;
  GraphReadPort(const GraphReadPort &) = default;
  GraphReadPort(GraphReadPort &&) = default;
  GraphReadPort &operator=(const GraphReadPort &) = default;
  GraphReadPort &operator=(GraphReadPort &&) = default;
  virtual ~GraphReadPort() = default;

  [[nodiscard]] virtual ReadResult<NodePtr> getNode(NodeId Id) const = 0;

  [[nodiscard]] virtual ReadResult<std::vector<NodePtr>>
  getNodeNeighbors(NodeId Id, std::string_view RelFilter,
                   Direction Dir) const = 0;

  [[nodiscard]] virtual ReadResult<std::vector<RelationshipPtr>>
  getNodeRelationships(NodeId Id, std::string_view RelFilter,
                       Direction Dir) const = 0;

  [[nodiscard]] virtual ReadResult<Path>
  findShortestPath(NodeId StartId, NodeId EndId,
                   std::string_view RelFilter,
                   std::int64_t MaxHops) const = 0;

  [[nodiscard]] virtual ReadResult<std::vector<Path>>
  findAllPaths(NodeId StartId, NodeId EndId,
               std::string_view RelFilter,
               std::int64_t MaxHops) const = 0;
};

template <> class fmt::formatter<Direction> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Direction Val,
                                                format_context &Ctx) const {
    switch (Val) {
    case Direction::Outgoing:
      return fmt::format_to(Ctx.out(), "OUTGOING");
    case Direction::Incoming:
      return fmt::format_to(Ctx.out(), "INCOMING");
    case Direction::Both:
      return fmt::format_to(Ctx.out(), "BOTH");
    }
    return Ctx.out();
  }
};

template <> class fmt::formatter<ReadError> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const ReadError &Val,
                                                format_context &Ctx) const {
    return fmt::format_to(
        Ctx.out(), "{} ({})",
        Val.Kind == ReadError::KindType::NotFound ? "not found" : "i/o error",
        Val.Message);
  }
};

// Unwraps a port result. Errors are logged and turned into std::nullopt, the
// caller skips whatever the read was meant to produce.
template <typename T>
[[nodiscard]] std::optional<T> valueOrSkip(ReadResult<T> Result,
                                           const std::string_view What,
                                           const NodeId Id) {
  if (auto *const Value = std::get_if<T>(&Result)) {
    return std::move(*Value);
  }
  spdlog::debug("skipping {} {}: {}", What, Id, std::get<ReadError>(Result));
  return std::nullopt;
}

#endif
