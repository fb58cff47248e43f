#include <core/inspector.hpp>

#include <cstdint>

namespace uuid4::core {

namespace {

  // Positions within the high and low 64-bit halves.
  constexpr unsigned version_shift = 76 - 64;
  constexpr std::uint64_t version_mask = 0xF;
  constexpr unsigned variant_shift = 62;

}// namespace

auto version_of(const identifier &id) noexcept -> int
{
  return static_cast<int>((high_bits(id) >> version_shift) & version_mask);
}

auto version_of(std::string_view text, hyphen_policy policy) -> int { return version_of(decode(text, 0, policy).id); }

auto variant_of(const identifier &id) noexcept -> int { return static_cast<int>(low_bits(id) >> variant_shift); }

}// namespace uuid4::core
