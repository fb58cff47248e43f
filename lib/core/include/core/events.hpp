#pragma once

#include <concepts>
#include <core/codec.hpp>
#include <string>
#include <variant>

namespace uuid4::core::events {

/// Generate one or more identifiers
struct generate
{
  int count = 1;///< Number of identifiers to generate
  int format = 36;///< Output length, one of supported_formats()
  bool all_formats = false;///< Print every rendering instead of one
};

/// Decode an identifier and show every rendering of it
struct decode
{
  std::string input;///< Identifier in any supported format
  int expected_length = 0;///< Required length, 0 to auto-detect
  hyphen_policy hyphens = hyphen_policy::lenient;///< Hyphen placement checking
};

/// Show the version nibble of an identifier
struct inspect
{
  std::string input;///< Identifier in any supported format
  hyphen_policy hyphens = hyphen_policy::lenient;///< Hyphen placement checking
};

/// List the supported formats
struct formats
{
};

/// Request application version information
struct version
{
};

/// Concept for command event types
template<typename T>
concept Command = std::same_as<T, generate> or std::same_as<T, decode> or std::same_as<T, inspect>
                  or std::same_as<T, formats> or std::same_as<T, version>;

/// Variant holding any command
using command_variant_t = std::variant<generate, decode, inspect, formats, version>;

}// namespace uuid4::core::events
