#ifndef traversal_lib_support_include_support_testcase_generation_hpp
#define traversal_lib_support_include_support_testcase_generation_hpp

#include <algorithm>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/for_each.hpp>
#include <range/v3/view/indices.hpp>

struct GeneratedEdge {
  std::size_t Start{};
  std::size_t End{};
  std::string Type{};
};

// nodes are the indices [0, NumNodes), node 0 is the root of every generated
// graph
struct GeneratedGraph {
  std::size_t NumNodes{};
  std::vector<GeneratedEdge> Edges{};
};

template <typename Generator>
[[nodiscard]] auto generateFromTemplate(Generator &&EdgeTemplateGenerator)
  requires std::is_invocable_r_v<std::vector<GeneratedEdge>, Generator,
                                 size_t>
{
  return [EdgeTemplateGenerator = std::forward<Generator>(
              EdgeTemplateGenerator)](const size_t NumRepetitions) {
    auto Edges = ranges::views::indices(NumRepetitions) |
                 ranges::views::for_each(EdgeTemplateGenerator) |
                 ranges::to<std::vector<GeneratedEdge>>;
    auto NumNodes = size_t{1U};
    for (const auto &Edge : Edges) {
      NumNodes = std::max({NumNodes, Edge.Start + 1U, Edge.End + 1U});
    }
    return GeneratedGraph{NumNodes, std::move(Edges)};
  };
}

// 0 - 1 - 2 - ... - N
inline const auto GenerateStraightPath =
    generateFromTemplate([](const size_t Iter) {
      return std::vector{GeneratedEdge{Iter, Iter + 1U, "NEXT"}};
    });

// complete binary tree with N inner nodes
inline const auto GenerateForkingPath =
    generateFromTemplate([](const size_t Iter) {
      return std::vector{GeneratedEdge{Iter, (Iter * 2U) + 1U, "CHILD"},
                         GeneratedEdge{Iter, (Iter * 2U) + 2U, "CHILD"}};
    });

// chain of N diamonds, the number of paths doubles with every diamond
inline const auto GenerateMultiForkingPath =
    generateFromTemplate([](const size_t Iter) {
      const auto Base = Iter * 3U;
      return std::vector{GeneratedEdge{Base, Base + 1U, "LEFT"},
                         GeneratedEdge{Base, Base + 2U, "RIGHT"},
                         GeneratedEdge{Base + 1U, Base + 3U, "LEFT"},
                         GeneratedEdge{Base + 2U, Base + 3U, "RIGHT"}};
    });

#endif
