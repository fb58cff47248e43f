#pragma once

#include <cstdio>
#include <fmt/core.h>
#include <utility>

namespace uuid4::core {

/**
 * @brief Formatted output to a C stream, stdout unless told otherwise.
 *
 * Generated identifiers go to stdout so they can be piped; diagnostics go
 * through spdlog to stderr and never mix with them.
 */
class default_printer
{
public:
  explicit default_printer(std::FILE *stream = stdout) : stream_(stream) {}

  /**
   * @brief Prints formatted output to the stream.
   *
   * @tparam Args Variadic template arguments for format string
   * @param format_string Format string in fmt library format
   * @param args Arguments to format into the string
   */
  template<typename... Args> auto print(fmt::format_string<Args...> format_string, Args &&...args) const -> void
  {
    fmt::print(stream_, format_string, std::forward<Args>(args)...);
  }

private:
  std::FILE *stream_;
};

}// namespace uuid4::core
