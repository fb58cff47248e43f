#pragma once

#include <concepts>
#include <string>

namespace uuid4::concepts {

template<typename T>
concept printer = requires(T printer, const std::string &text) {
  // Print formatted strings
  { printer.print("{}\n", text) } -> std::same_as<void>;
  { printer.print("{}: {}\n", 0, text) } -> std::same_as<void>;
};

}// namespace uuid4::concepts
