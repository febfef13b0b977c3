#ifndef traversal_lib_traversal_include_traversal_config_hpp
#define traversal_lib_traversal_include_traversal_config_hpp

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

// NodeGlobal: a node may not appear twice on the branch being walked, it is
// released again when the walk backtracks.
// RelationshipPath: a relationship may not appear twice in one path.
// None: no restriction, the walk is bounded by MaxLevel and Limit only. With
// neither bound set it runs as RelationshipPath, see getEffectiveUniqueness.
enum class Uniqueness { NodeGlobal, RelationshipPath, None };

// Options shared by all traversals. The values are not validated,
// contradicting bounds (MinLevel > MaxLevel, negative MaxLevel) produce empty
// results instead of errors.
class TraversalConfig {
public:
  template <typename ValueType>
  using MappingType = std::pair<std::string_view, ValueType TraversalConfig::*>;

  using BooleanMappingType = MappingType<bool>;
  using LevelMappingType = MappingType<std::int64_t>;
  using FilterMappingType = MappingType<std::string>;

  [[nodiscard]] static consteval auto getConfigMapping() {
    return std::tuple{
        std::array{
            BooleanMappingType{"Bfs", &TraversalConfig::Bfs},
        },
        std::array{
            LevelMappingType{"MinLevel", &TraversalConfig::MinLevel},
            LevelMappingType{"MaxLevel", &TraversalConfig::MaxLevel},
            LevelMappingType{"Limit", &TraversalConfig::Limit},
        },
        std::array{
            FilterMappingType{"RelationshipFilter",
                              &TraversalConfig::RelationshipFilter},
            FilterMappingType{"LabelFilter", &TraversalConfig::LabelFilter},
        }};
  }

  [[nodiscard]] static TraversalConfig parse(const std::filesystem::path &File);

  void save(const std::filesystem::path &File) const;

  [[nodiscard]] bool isLimitReached(const std::size_t Count) const {
    return Limit > 0 && Count >= static_cast<std::size_t>(Limit);
  }

  // no depth satisfies both bounds, e.g. a negative MaxLevel
  [[nodiscard]] bool hasEmptyLevelRange() const {
    return MaxLevel < 0 || MinLevel > MaxLevel;
  }

  [[nodiscard]] bool hasMaxLevel() const {
    return MaxLevel != std::numeric_limits<std::int64_t>::max();
  }

  // an unguarded walk without MaxLevel and Limit would revisit the same
  // relationship forever, it falls back to RelationshipPath
  [[nodiscard]] Uniqueness getEffectiveUniqueness() const {
    if (Unique == Uniqueness::None && !hasMaxLevel() && Limit <= 0) {
      return Uniqueness::RelationshipPath;
    }
    return Unique;
  }

  // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
  std::int64_t MinLevel = 0;
  std::int64_t MaxLevel = std::numeric_limits<std::int64_t>::max();

  // passed through to the graph port, e.g. "KNOWS>|<LIKES"
  std::string RelationshipFilter{};

  // "+Allowed|-Denied", see LabelFilter
  std::string LabelFilter{};

  // <= 0 means unbounded
  std::int64_t Limit = 0;

  Uniqueness Unique = Uniqueness::NodeGlobal;
  bool Bfs = false;
  // NOLINTEND(misc-non-private-member-variables-in-classes)
};

template <> struct llvm::yaml::ScalarEnumerationTraits<Uniqueness> {
  static void enumeration(llvm::yaml::IO &YamlIO, Uniqueness &Value);
};

template <> struct llvm::yaml::MappingTraits<TraversalConfig> {
  static void mapping(llvm::yaml::IO &YamlIO, TraversalConfig &Conf);
};

template <> class fmt::formatter<Uniqueness> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(const Uniqueness Val,
                                                format_context &Ctx) const {
    switch (Val) {
    case Uniqueness::NodeGlobal:
      return fmt::format_to(Ctx.out(), "NODE_GLOBAL");
    case Uniqueness::RelationshipPath:
      return fmt::format_to(Ctx.out(), "RELATIONSHIP_PATH");
    case Uniqueness::None:
      return fmt::format_to(Ctx.out(), "NONE");
    }
    return Ctx.out();
  }
};

template <> class fmt::formatter<TraversalConfig> {
public:
  [[nodiscard]] constexpr format_parse_context::iterator
  parse(format_parse_context &Ctx) {
    return Ctx.begin();
  }

  [[nodiscard]] format_context::iterator format(TraversalConfig Conf,
                                                format_context &Ctx) const {
    std::string Str;
    llvm::raw_string_ostream Stream{Str};
    auto OutStream = llvm::yaml::Output{Stream};
    OutStream << Conf;
    return fmt::format_to(Ctx.out(), "{}", Stream.str());
  }
};

#endif
