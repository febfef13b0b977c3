#include "traversal/config.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <system_error>

#include <fmt/std.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/range/concepts.hpp>
#include <range/v3/utility/tuple_algorithm.hpp>
#include <spdlog/spdlog.h>

#include "support/traversal_exception.hpp"

TraversalConfig TraversalConfig::parse(const std::filesystem::path &File) {
  TraversalException::verify(std::filesystem::exists(File),
                             "Config file does not exist ({})", File);

  auto FileStream = std::ifstream{File};
  const auto FileData = std::string{std::istreambuf_iterator<char>{FileStream},
                                    std::istreambuf_iterator<char>{}};
  auto Input = llvm::yaml::Input{FileData};
  auto Conf = TraversalConfig{};
  Input >> Conf;

  const auto Error = Input.error();
  TraversalException::verify(!Error, "Failed to parse config file {}: {}",
                             File, Error.message());
  spdlog::debug("loaded traversal config from {}:\n{}", File, Conf);
  return Conf;
}

void TraversalConfig::save(const std::filesystem::path &File) const {
  auto Error = std::error_code{};
  const auto FileName = File.string();
  auto FileStream = llvm::raw_fd_ostream{FileName, Error};
  TraversalException::verify(!Error, "Error while opening config file {}: {}",
                             File, Error.message());
  auto OutStream = llvm::yaml::Output{FileStream};
  auto Conf = *this;
  OutStream << Conf;
  FileStream.flush();
  TraversalException::verify(!FileStream.has_error(),
                             "Error while writing config file {}: {}", File,
                             FileStream.error().message());
}

void llvm::yaml::ScalarEnumerationTraits<Uniqueness>::enumeration(
    llvm::yaml::IO &YamlIO, Uniqueness &Value) {
  YamlIO.enumCase(Value, "NODE_GLOBAL", Uniqueness::NodeGlobal);
  YamlIO.enumCase(Value, "RELATIONSHIP_PATH", Uniqueness::RelationshipPath);
  YamlIO.enumCase(Value, "NONE", Uniqueness::None);
}

void llvm::yaml::MappingTraits<TraversalConfig>::mapping(
    llvm::yaml::IO &YamlIO, TraversalConfig &Conf) {
  const auto MapOptionals = [&Conf,
                             &YamlIO](const ranges::range auto &Mappings) {
    const auto MapOptional =
        [&Conf, &YamlIO]<typename ValueType>(
            const TraversalConfig::MappingType<ValueType> &MappingValue) {
          const auto &[ValueName, ValueAddress] = MappingValue;
          YamlIO.mapOptional(ValueName.data(), std::invoke(ValueAddress, Conf));
        };

    ranges::for_each(Mappings, MapOptional);
  };

  ranges::tuple_for_each(TraversalConfig::getConfigMapping(), MapOptionals);
  YamlIO.mapOptional("Unique", Conf.Unique);
}
