#include <core/radix.hpp>

#include <algorithm>
#include <array>
#include <core/errors.hpp>
#include <cstdint>
#include <fmt/format.h>
#include <stdexcept>

namespace uuid4::core {

namespace {

  constexpr unsigned bits_per_byte = 8;
  constexpr unsigned byte_mask = 0xFFU;

  auto check_base(int base) -> void
  {
    if (base < min_radix or base > max_radix) {
      throw std::invalid_argument(fmt::format("Base {} out of range [{}, {}]", base, min_radix, max_radix));
    }
  }

}// namespace

auto to_radix(const identifier &id, int base, std::size_t width) -> std::string
{
  check_base(base);

  const auto alphabet = base > static_cast<int>(lower_digits.size()) ? base62_digits : lower_digits;
  const auto divisor = static_cast<unsigned>(base);

  std::array<std::uint8_t, identifier::static_size()> value{};
  std::ranges::copy(id.data, value.begin());

  std::string digits;
  while (std::ranges::any_of(value, [](std::uint8_t byte) { return byte != 0; })) {
    unsigned remainder = 0;
    for (auto &byte : value) {
      const unsigned current = (remainder << bits_per_byte) | byte;
      byte = static_cast<std::uint8_t>(current / divisor);
      remainder = current % divisor;
    }
    digits.push_back(alphabet[remainder]);
  }

  if (digits.size() < width) { digits.append(width - digits.size(), alphabet.front()); }
  std::ranges::reverse(digits);
  return digits;
}

auto from_radix(std::string_view text, int base) -> identifier
{
  check_base(base);

  if (text.empty()) { throw parse_error(fmt::format("Invalid base-{} number: empty string", base)); }

  const auto multiplier = static_cast<unsigned>(base);
  identifier id{};

  for (const char c : text) {
    const auto digit = digit_value(c, base);
    if (digit < 0) { throw parse_error(fmt::format("Invalid base-{} digit '{}' in `{}`", base, c, text)); }

    auto carry = static_cast<unsigned>(digit);
    for (auto i = identifier::static_size(); i > 0; --i) {
      auto &byte = id.data[i - 1];
      const unsigned product = (static_cast<unsigned>(byte) * multiplier) + carry;
      byte = static_cast<std::uint8_t>(product & byte_mask);
      carry = product >> bits_per_byte;
    }
    if (carry != 0) { throw parse_error(fmt::format("Base-{} number `{}` overflows 128 bits", base, text)); }
  }

  return id;
}

}// namespace uuid4::core
