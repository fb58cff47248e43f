#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>

namespace uuid4::core {

/**
 * @brief Describes one fixed-length textual rendering of an identifier.
 *
 * Every format renders the value in `base`, left-padded to `digits`
 * characters. Hyphenated formats then insert `hyphens` separators, one after
 * every `group` characters. The canonical 8-4-4-4-12 layout has irregular
 * groups and is flagged with `canonical` instead.
 */
struct format
{
  int length;///< Total string length, hyphens included
  int base;///< Numeric base of the digits
  int digits;///< Number of digits before hyphen insertion
  int group;///< Characters per group, 0 when not evenly grouped
  int hyphens;///< Number of hyphens in the rendering
  bool case_sensitive;///< Whether upper and lower case letters differ in value
  bool canonical;///< RFC 4122 8-4-4-4-12 layout
};

inline constexpr std::size_t format_count = 7;

inline constexpr std::array<format, format_count> format_table{ {
  { .length = 22, .base = 62, .digits = 22, .group = 0, .hyphens = 0, .case_sensitive = true, .canonical = false },
  { .length = 24, .base = 62, .digits = 22, .group = 7, .hyphens = 2, .case_sensitive = true, .canonical = false },
  { .length = 25, .base = 36, .digits = 25, .group = 0, .hyphens = 0, .case_sensitive = false, .canonical = false },
  { .length = 29, .base = 36, .digits = 25, .group = 5, .hyphens = 4, .case_sensitive = false, .canonical = false },
  { .length = 32, .base = 16, .digits = 32, .group = 0, .hyphens = 0, .case_sensitive = false, .canonical = false },
  { .length = 36, .base = 16, .digits = 32, .group = 0, .hyphens = 4, .case_sensitive = false, .canonical = true },
  { .length = 39, .base = 16, .digits = 32, .group = 4, .hyphens = 7, .case_sensitive = false, .canonical = false },
} };

/**
 * @brief Lists the supported string lengths in ascending order.
 *
 * @return {22, 24, 25, 29, 32, 36, 39}
 */
[[nodiscard]] constexpr auto supported_formats() noexcept -> std::array<int, format_count>
{
  std::array<int, format_count> lengths{};
  std::ranges::transform(format_table, lengths.begin(), [](const format &entry) { return entry.length; });
  return lengths;
}

[[nodiscard]] constexpr auto is_supported_format(int length) noexcept -> bool
{
  return std::ranges::any_of(format_table, [length](const format &entry) { return entry.length == length; });
}

/**
 * @brief Looks up the descriptor of a supported length.
 *
 * @param length Requested string length
 * @return Descriptor for that length
 * @throws invalid_format if length is not one of supported_formats()
 */
[[nodiscard]] auto format_of(int length) -> const format &;

/**
 * @brief Describes the hyphen grouping of a format.
 *
 * @return "7-7-8" for length 24, "8-4-4-4-12" for length 36, "none" when un-hyphenated
 */
[[nodiscard]] auto grouping_of(const format &layout) -> std::string;

}// namespace uuid4::core
