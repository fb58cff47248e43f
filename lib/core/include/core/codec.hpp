#pragma once

#include <core/formats.hpp>
#include <core/identifier.hpp>
#include <map>
#include <string>
#include <string_view>

namespace uuid4::core {

/**
 * @brief How decode treats hyphen placement in the 24, 29 and 39 length formats.
 *
 * The canonical 36 length format always has its hyphen positions checked.
 */
enum class hyphen_policy {
  lenient,///< Strip every hyphen wherever it occurs (matches strings produced by older tools)
  strict,///< Require hyphens exactly where encode() puts them
};

/// Result of decode: the format length that matched and the decoded value.
struct decode_result
{
  int length;
  identifier id;
};

/**
 * @brief Inserts a hyphen after every `group` characters, at most `count` times.
 *
 * Never produces a leading or trailing hyphen.
 *
 * @param digits Un-hyphenated text
 * @param group Characters per group, greater than zero
 * @param count Maximum number of hyphens to insert
 * @return Hyphenated text, e.g. hyphenate("abcdefgh", 3, 2) == "abc-def-gh"
 */
[[nodiscard]] auto hyphenate(std::string_view digits, int group, int count) -> std::string;

/// Removes every '-' from text.
[[nodiscard]] auto strip_hyphens(std::string_view text) -> std::string;

/**
 * @brief Renders an identifier in every supported format.
 *
 * Each base is converted once; hyphenated formats are derived from their
 * un-hyphenated sibling.
 *
 * @param id Value to render
 * @return Map from format length to rendering, one entry per supported_formats()
 */
[[nodiscard]] auto encode(const identifier &id) -> std::map<int, std::string>;

/**
 * @brief Renders an identifier in one format.
 *
 * @param id Value to render
 * @param length One of supported_formats()
 * @return Rendering of exactly `length` characters
 * @throws invalid_format if length is zero, negative or unsupported
 */
[[nodiscard]] auto encode(const identifier &id, int length) -> std::string;

/// encode(id) for a freshly generated identifier.
[[nodiscard]] auto encode() -> std::map<int, std::string>;

/// encode(id, length) for a freshly generated identifier.
[[nodiscard]] auto encode(int length) -> std::string;

/**
 * @brief Parses an identifier, detecting the format from the input length.
 *
 * Validation order:
 * 1. expected_length < 0                        -> invalid_format
 * 2. expected_length > 0 and != text length     -> length_mismatch
 * 3. text length not in supported_formats()     -> unsupported_length
 * 4. characters outside the alphabet, overflow,
 *    misplaced canonical (or strict) hyphens    -> parse_error
 *
 * Lengths are counted in UTF-8 code points, so a non-ASCII character counts
 * once and then fails the alphabet check as parse_error.
 *
 * Lengths 24, 29 and 39 have their hyphens stripped and are decoded as 22, 25
 * and 32 respectively; a wrong hyphen count therefore surfaces as
 * length_mismatch under hyphen_policy::lenient.
 *
 * @param text Input string
 * @param expected_length Required length, or 0 to auto-detect
 * @param policy Hyphen placement checking for the evenly grouped formats
 * @return Matched length (the length of text) and decoded identifier
 */
[[nodiscard]] auto decode(std::string_view text, int expected_length = 0, hyphen_policy policy = hyphen_policy::lenient)
  -> decode_result;

}// namespace uuid4::core
