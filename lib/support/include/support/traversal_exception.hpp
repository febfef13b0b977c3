#ifndef traversal_lib_support_include_support_traversal_exception_hpp
#define traversal_lib_support_include_support_traversal_exception_hpp

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

class TraversalException : public std::exception {
public:
  explicit TraversalException(std::string Message)
      : Message_(std::move(Message)) {
    spdlog::error(Message_);
    spdlog::dump_backtrace();
  }

  template <typename... Ts>
    requires(sizeof...(Ts) > 0)
  explicit TraversalException(const std::string_view FormatString,
                              Ts &&...Args)
      : TraversalException{fmt::format(fmt::runtime(FormatString),
                                       std::forward<Ts>(Args)...)} {}

  [[nodiscard]] const char *what() const noexcept final {
    return Message_.c_str();
  }

  template <typename... Ts>
  static void verify(const bool Condition, const std::string_view FormatString,
                     Ts &&...Args) {
    if (!Condition) {
      fail(FormatString, std::forward<Ts>(Args)...);
    }
  }

  template <typename... Ts>
  [[noreturn]] static void fail(const std::string_view FormatString,
                                Ts &&...Args) {
    throw TraversalException{
        fmt::format(fmt::runtime(FormatString), std::forward<Ts>(Args)...)};
  }

private:
  std::string Message_;
};

#endif
