#ifndef traversal_lib_support_include_support_ranges_functional_hpp
#define traversal_lib_support_include_support_ranges_functional_hpp

#include <concepts>
#include <utility>

#include <range/v3/functional/comparisons.hpp>

inline constexpr auto Copy = [](std::copyable auto Val) {
  return std::move(Val);
};

inline constexpr auto EqualTo = []<std::regular T>(T Rhs) constexpr {
  return [Rhs]<std::regular U>
    requires std::equality_comparable_with<U, T>
  (const U &Lhs) constexpr { return ranges::equal_to{}(Lhs, Rhs); };
};

inline constexpr auto NotEqualTo = []<std::regular T>(T Rhs) constexpr {
  return [Rhs]<std::regular U>
    requires std::equality_comparable_with<U, T>
  (const U &Lhs) constexpr { return ranges::not_equal_to{}(Lhs, Rhs); };
};

#endif
