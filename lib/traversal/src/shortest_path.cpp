#include "traversal/shortest_path.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <range/v3/action/stable_sort.hpp>
#include <range/v3/action/take.hpp>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/algorithm/min.hpp>
#include <range/v3/functional/comparisons.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "support/ranges/functional.hpp"

namespace {
[[nodiscard]] std::vector<Path> collectPaths(const GraphReadPort &Graph,
                                             const NodePtr &Start,
                                             const NodePtr &End,
                                             const std::string_view RelFilter,
                                             const std::int64_t MaxHops) {
  if (!Start || !End) {
    return {};
  }
  auto Paths =
      valueOrSkip(Graph.findAllPaths(Start->Id, End->Id, RelFilter, MaxHops),
                  "paths from node", Start->Id);
  if (!Paths) {
    return {};
  }
  return std::move(*Paths);
}

[[nodiscard]] std::vector<Path> keepLength(const std::vector<Path> &Paths,
                                           const std::size_t Length) {
  return Paths | ranges::views::filter(EqualTo(Length), &Path::getLength) |
         ranges::to_vector;
}
} // namespace

std::optional<Path> shortestPath(const GraphReadPort &Graph,
                                 const NodePtr &Start, const NodePtr &End,
                                 const std::string_view RelFilter,
                                 const std::int64_t MaxHops) {
  if (!Start || !End) {
    return std::nullopt;
  }
  return valueOrSkip(Graph.findShortestPath(Start->Id, End->Id, RelFilter,
                                            MaxHops),
                     "shortest path from node", Start->Id);
}

std::vector<Path> allShortestPaths(const GraphReadPort &Graph,
                                   const NodePtr &Start, const NodePtr &End,
                                   const std::string_view RelFilter,
                                   const std::int64_t MaxHops) {
  auto Paths = collectPaths(Graph, Start, End, RelFilter, MaxHops);
  if (Paths.empty()) {
    return {};
  }

  const auto MinLength =
      ranges::min(Paths | ranges::views::transform(&Path::getLength));
  auto Shortest = keepLength(Paths, MinLength);
  spdlog::debug("allShortestPaths from {} to {}: {} paths of length {}",
                *Start, *End, Shortest.size(), MinLength);
  return Shortest;
}

std::vector<Path> longestPaths(const GraphReadPort &Graph,
                               const NodePtr &Start, const NodePtr &End,
                               const std::string_view RelFilter,
                               const std::int64_t MaxHops) {
  auto Paths = collectPaths(Graph, Start, End, RelFilter, MaxHops);
  if (Paths.empty()) {
    return {};
  }

  const auto MaxLength =
      ranges::max(Paths | ranges::views::transform(&Path::getLength));
  auto Longest = keepLength(Paths, MaxLength);
  spdlog::debug("longestPaths from {} to {}: {} paths of length {}", *Start,
                *End, Longest.size(), MaxLength);
  return Longest;
}

std::vector<Path> kShortestPaths(const GraphReadPort &Graph,
                                 const NodePtr &Start, const NodePtr &End,
                                 const std::string_view RelFilter,
                                 const std::int64_t MaxHops,
                                 const std::int64_t K) {
  if (K <= 0) {
    return {};
  }
  return collectPaths(Graph, Start, End, RelFilter, MaxHops) |
         ranges::actions::stable_sort(ranges::less{}, &Path::getLength) |
         ranges::actions::take(K);
}

std::vector<Path> pathsWithLength(const GraphReadPort &Graph,
                                  const NodePtr &Start, const NodePtr &End,
                                  const std::string_view RelFilter,
                                  const std::int64_t Length) {
  if (Length < 0) {
    return {};
  }
  return keepLength(collectPaths(Graph, Start, End, RelFilter, Length),
                    static_cast<std::size_t>(Length));
}

std::vector<Path> pathsWithinLength(const GraphReadPort &Graph,
                                    const NodePtr &Start, const NodePtr &End,
                                    const std::string_view RelFilter,
                                    const std::int64_t MinLength,
                                    const std::int64_t MaxLength) {
  const auto Paths = collectPaths(Graph, Start, End, RelFilter, MaxLength);
  return Paths |
         ranges::views::filter(
             [MinLength, MaxLength](const std::size_t Length) {
               const auto Signed = static_cast<std::int64_t>(Length);
               return Signed >= MinLength && Signed <= MaxLength;
             },
             &Path::getLength) |
         ranges::to_vector;
}

std::size_t countPaths(const GraphReadPort &Graph, const NodePtr &Start,
                       const NodePtr &End, const std::string_view RelFilter,
                       const std::int64_t MaxHops) {
  return collectPaths(Graph, Start, End, RelFilter, MaxHops).size();
}

bool pathExists(const GraphReadPort &Graph, const NodePtr &Start,
                const NodePtr &End, const std::string_view RelFilter,
                const std::int64_t MaxHops) {
  return shortestPath(Graph, Start, End, RelFilter, MaxHops).has_value();
}

std::optional<std::size_t> distance(const GraphReadPort &Graph,
                                    const NodePtr &Start, const NodePtr &End,
                                    const std::string_view RelFilter,
                                    const std::int64_t MaxHops) {
  if (const auto Found = shortestPath(Graph, Start, End, RelFilter, MaxHops)) {
    return Found->getLength();
  }
  return std::nullopt;
}
