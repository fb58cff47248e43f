#pragma once

#include <core/identifier.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace uuid4::core {

inline constexpr int min_radix = 2;
inline constexpr int max_radix = 62;

/// Digits of bases up to 36, lowercase.
inline constexpr std::string_view lower_digits = "0123456789abcdefghijklmnopqrstuvwxyz";

/// Digits of bases above 36: decimal, then upper case, then lower case.
inline constexpr std::string_view base62_digits = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

/**
 * @brief Returns the value of a single digit in the given base.
 *
 * Up to base 36 letters are case-insensitive. Above base 36 'A'..'Z' are
 * 10..35 and 'a'..'z' are 36..61.
 *
 * @param c Character to classify
 * @param base Numeric base in [2, 62]
 * @return Digit value, or -1 if c is not a digit of base
 */
[[nodiscard]] constexpr auto digit_value(char c, int base) noexcept -> int
{
  constexpr int letter_offset = 10;
  constexpr int case_sensitive_above = 36;

  int value = -1;
  if (c >= '0' and c <= '9') {
    value = c - '0';
  } else if (c >= 'A' and c <= 'Z') {
    value = c - 'A' + letter_offset;
  } else if (c >= 'a' and c <= 'z') {
    value = c - 'a' + (base > case_sensitive_above ? case_sensitive_above : letter_offset);
  }
  return value < base ? value : -1;
}

/**
 * @brief Renders the 128-bit value of an identifier in an arbitrary base.
 *
 * Digits are produced least significant first by repeated division of the
 * 16 byte value, then reversed. The result is left-padded with the zero
 * digit to at least `width` characters.
 *
 * @param id Value to render
 * @param base Numeric base in [2, 62]
 * @param width Minimum number of digits
 * @return Digit string, lowercase for bases up to 36
 * @throws std::invalid_argument if base is out of range
 */
[[nodiscard]] auto to_radix(const identifier &id, int base, std::size_t width) -> std::string;

/**
 * @brief Parses a digit string in an arbitrary base into a 128-bit value.
 *
 * @param text Digits only; no sign, prefix, whitespace or separators
 * @param base Numeric base in [2, 62]
 * @return Parsed value
 * @throws parse_error on an empty string, a character outside the base, or a value above 2^128 - 1
 * @throws std::invalid_argument if base is out of range
 */
[[nodiscard]] auto from_radix(std::string_view text, int base) -> identifier;

}// namespace uuid4::core
