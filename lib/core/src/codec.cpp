#include <core/codec.hpp>

#include <algorithm>
#include <array>
#include <core/errors.hpp>
#include <core/generator.hpp>
#include <core/radix.hpp>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>
#include <stdexcept>

namespace uuid4::core {

namespace {

  constexpr char hyphen = '-';

  /// Digit offsets before which the canonical layout places a hyphen (8-4-4-4-12).
  constexpr std::array<std::size_t, 4> canonical_breaks{ 8, 12, 16, 20 };

  /// Character positions of the hyphens in a canonical string.
  constexpr std::array<std::size_t, 4> canonical_hyphens{ 8, 13, 18, 23 };

  constexpr unsigned char utf8_continuation_mask = 0xC0U;
  constexpr unsigned char utf8_continuation_bits = 0x80U;

  /// Number of UTF-8 code points in text; every byte that does not continue a sequence starts one.
  auto character_length(std::string_view text) -> std::size_t
  {
    return static_cast<std::size_t>(std::ranges::count_if(text, [](char c) {
      return (static_cast<unsigned char>(c) & utf8_continuation_mask) != utf8_continuation_bits;
    }));
  }

  auto canonical_layout(std::string_view hex) -> std::string
  {
    std::string out;
    out.reserve(hex.size() + canonical_breaks.size());
    for (std::size_t i = 0; i < hex.size(); ++i) {
      if (std::ranges::find(canonical_breaks, i) != canonical_breaks.end()) { out.push_back(hyphen); }
      out.push_back(hex[i]);
    }
    return out;
  }

  auto render(std::string_view digits, const format &layout) -> std::string
  {
    if (layout.canonical) { return canonical_layout(digits); }
    if (layout.hyphens > 0) { return hyphenate(digits, layout.group, layout.hyphens); }
    return std::string(digits);
  }

  auto parse_canonical(std::string_view text) -> identifier
  {
    for (const auto pos : canonical_hyphens) {
      if (text[pos] != hyphen) {
        throw parse_error(fmt::format("Invalid id `{}`: expected '-' at position {}", text, pos));
      }
    }

    std::string hex;
    hex.reserve(text.size() - canonical_hyphens.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
      if (std::ranges::find(canonical_hyphens, i) == canonical_hyphens.end()) { hex.push_back(text[i]); }
    }
    return from_radix(hex, format_of(36).base);
  }

  auto check_hyphen_positions(std::string_view text, const format &layout) -> void
  {
    const auto stride = static_cast<std::size_t>(layout.group) + 1;
    const auto last = stride * static_cast<std::size_t>(layout.hyphens);

    for (std::size_t i = 0; i < text.size(); ++i) {
      const auto position = i + 1;
      const bool wants_hyphen = position % stride == 0 and position <= last;
      if ((text[i] == hyphen) != wants_hyphen) {
        throw parse_error(fmt::format(
          "Invalid id `{}`: misplaced '-' at position {} (expected groups of {})", text, i, layout.group));
      }
    }
  }

}// namespace

auto hyphenate(std::string_view digits, int group, int count) -> std::string
{
  if (group <= 0) { throw std::invalid_argument(fmt::format("Invalid hyphen group size {}", group)); }

  const auto stride = static_cast<std::size_t>(group);
  std::string out;
  out.reserve(digits.size() + static_cast<std::size_t>(std::max(count, 0)));

  int inserted = 0;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 and i % stride == 0 and inserted < count) {
      out.push_back(hyphen);
      ++inserted;
    }
    out.push_back(digits[i]);
  }
  return out;
}

auto strip_hyphens(std::string_view text) -> std::string
{
  std::string out;
  out.reserve(text.size());
  std::ranges::copy_if(text, std::back_inserter(out), [](char c) { return c != hyphen; });
  return out;
}

auto encode(const identifier &id) -> std::map<int, std::string>
{
  std::map<int, std::string> digits_by_base;
  for (const auto &layout : format_table) {
    if (not digits_by_base.contains(layout.base)) {
      digits_by_base.emplace(layout.base, to_radix(id, layout.base, static_cast<std::size_t>(layout.digits)));
    }
  }

  std::map<int, std::string> renderings;
  for (const auto &layout : format_table) {
    renderings.emplace(layout.length, render(digits_by_base.at(layout.base), layout));
  }
  return renderings;
}

auto encode(const identifier &id, int length) -> std::string
{
  const auto &layout = format_of(length);
  return render(to_radix(id, layout.base, static_cast<std::size_t>(layout.digits)), layout);
}

auto encode() -> std::map<int, std::string> { return encode(generate()); }

auto encode(int length) -> std::string { return encode(generate(), length); }

auto decode(std::string_view text, int expected_length, hyphen_policy policy) -> decode_result
{
  const auto length = character_length(text);

  if (expected_length < 0) {
    throw invalid_format(fmt::format("Invalid format {} (should be positive)", expected_length));
  }
  if (expected_length > 0 and length != static_cast<std::size_t>(expected_length)) {
    throw length_mismatch(
      fmt::format("Invalid id `{}` with length = {} (should be {})", text, length, expected_length));
  }

  constexpr auto longest = static_cast<std::size_t>(supported_formats().back());
  if (length > longest or not is_supported_format(static_cast<int>(length))) {
    throw unsupported_length(fmt::format("Invalid id `{}` with length = {}", text, length));
  }

  const auto &layout = format_of(static_cast<int>(length));

  if (layout.canonical) { return { .length = layout.length, .id = parse_canonical(text) }; }

  if (layout.hyphens > 0) {
    if (policy == hyphen_policy::strict) { check_hyphen_positions(text, layout); }
    return { .length = layout.length, .id = decode(strip_hyphens(text), layout.digits, policy).id };
  }

  return { .length = layout.length, .id = from_radix(text, layout.base) };
}

}// namespace uuid4::core
