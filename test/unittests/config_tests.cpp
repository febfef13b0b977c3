#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>

#include <catch2/catch_test_macros.hpp>
#include <fmt/core.h>
#include <fmt/format.h>

#include "support/traversal_exception.hpp"
#include "traversal/config.hpp"

namespace {
// removes the file when the test is done with it
class TemporaryFile {
public:
  explicit TemporaryFile(const std::string &Name)
      : File_(std::filesystem::temp_directory_path() / Name) {
    std::filesystem::remove(File_);
  }
  TemporaryFile(const TemporaryFile &) = delete;
  TemporaryFile(TemporaryFile &&) = delete;
  TemporaryFile &operator=(const TemporaryFile &) = delete;
  TemporaryFile &operator=(TemporaryFile &&) = delete;
  ~TemporaryFile() {
    auto Error = std::error_code{};
    std::filesystem::remove(File_, Error);
  }

  [[nodiscard]] const std::filesystem::path &getPath() const { return File_; }

  void write(const std::string &Content) const {
    auto Stream = std::ofstream{File_};
    Stream << Content;
  }

private:
  std::filesystem::path File_;
};
} // namespace

TEST_CASE("config defaults") {
  const auto Conf = TraversalConfig{};
  REQUIRE(Conf.MinLevel == 0);
  REQUIRE(Conf.MaxLevel == std::numeric_limits<std::int64_t>::max());
  REQUIRE(Conf.RelationshipFilter.empty());
  REQUIRE(Conf.LabelFilter.empty());
  REQUIRE(Conf.Limit == 0);
  REQUIRE(Conf.Unique == Uniqueness::NodeGlobal);
  REQUIRE_FALSE(Conf.Bfs);
  REQUIRE_FALSE(Conf.hasEmptyLevelRange());
}

TEST_CASE("config limit") {
  REQUIRE_FALSE(TraversalConfig{}.isLimitReached(1000U));
  REQUIRE_FALSE(TraversalConfig{.Limit = -1}.isLimitReached(1000U));
  REQUIRE_FALSE(TraversalConfig{.Limit = 2}.isLimitReached(1U));
  REQUIRE(TraversalConfig{.Limit = 2}.isLimitReached(2U));
}

TEST_CASE("config level range") {
  REQUIRE(TraversalConfig{.MaxLevel = -1}.hasEmptyLevelRange());
  REQUIRE(TraversalConfig{.MinLevel = 3, .MaxLevel = 2}.hasEmptyLevelRange());
  REQUIRE_FALSE(
      TraversalConfig{.MinLevel = 2, .MaxLevel = 2}.hasEmptyLevelRange());
  REQUIRE_FALSE(TraversalConfig{.MinLevel = -4, .MaxLevel = 0}
                    .hasEmptyLevelRange());
}

TEST_CASE("config save and parse") {
  const auto File = TemporaryFile{"traversal_config_roundtrip.yaml"};
  const auto Conf = TraversalConfig{.MinLevel = 1,
                                    .MaxLevel = 4,
                                    .RelationshipFilter = "KNOWS>|<LIKES",
                                    .LabelFilter = "+Person|-Blocked",
                                    .Limit = 25,
                                    .Unique = Uniqueness::RelationshipPath,
                                    .Bfs = true};
  Conf.save(File.getPath());
  REQUIRE(std::filesystem::exists(File.getPath()));

  const auto Parsed = TraversalConfig::parse(File.getPath());
  REQUIRE(Parsed.MinLevel == Conf.MinLevel);
  REQUIRE(Parsed.MaxLevel == Conf.MaxLevel);
  REQUIRE(Parsed.RelationshipFilter == Conf.RelationshipFilter);
  REQUIRE(Parsed.LabelFilter == Conf.LabelFilter);
  REQUIRE(Parsed.Limit == Conf.Limit);
  REQUIRE(Parsed.Unique == Conf.Unique);
  REQUIRE(Parsed.Bfs == Conf.Bfs);
}

TEST_CASE("config parse keeps defaults for missing keys") {
  const auto File = TemporaryFile{"traversal_config_partial.yaml"};
  File.write("MaxLevel: 3\nUnique: NONE\n");

  const auto Parsed = TraversalConfig::parse(File.getPath());
  REQUIRE(Parsed.MaxLevel == 3);
  REQUIRE(Parsed.Unique == Uniqueness::None);
  REQUIRE(Parsed.MinLevel == 0);
  REQUIRE(Parsed.Limit == 0);
  REQUIRE(Parsed.RelationshipFilter.empty());
  REQUIRE_FALSE(Parsed.Bfs);
}

TEST_CASE("config parse errors") {
  REQUIRE_THROWS_AS(
      TraversalConfig::parse(std::filesystem::temp_directory_path() /
                             "traversal_config_does_not_exist.yaml"),
      TraversalException);

  const auto File = TemporaryFile{"traversal_config_invalid.yaml"};
  File.write("Unique: SOMETIMES\n");
  REQUIRE_THROWS_AS(TraversalConfig::parse(File.getPath()),
                    TraversalException);

  const auto Malformed = TemporaryFile{"traversal_config_malformed.yaml"};
  Malformed.write("MaxLevel: [1, 2\n");
  REQUIRE_THROWS_AS(TraversalConfig::parse(Malformed.getPath()),
                    TraversalException);
}

TEST_CASE("config formatting") {
  REQUIRE(fmt::format("{}", Uniqueness::NodeGlobal) == "NODE_GLOBAL");
  REQUIRE(fmt::format("{}", Uniqueness::RelationshipPath) ==
          "RELATIONSHIP_PATH");
  REQUIRE(fmt::format("{}", Uniqueness::None) == "NONE");

  const auto Formatted =
      fmt::format("{}", TraversalConfig{.Limit = 7, .Bfs = true});
  REQUIRE(Formatted.find("Limit:") != std::string::npos);
  REQUIRE(Formatted.find("Bfs:") != std::string::npos);
  REQUIRE(Formatted.find("Unique:") != std::string::npos);
}
