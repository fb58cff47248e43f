#pragma once

#include <boost/random/uniform_int_distribution.hpp>
#include <concepts/entropy_source.hpp>
#include <core/identifier.hpp>
#include <cstdint>

namespace uuid4::core {

/// Clears the version nibble (bits 48-51 from the top).
inline constexpr std::uint64_t version_clear_mask = 0xFFFF'FFFF'FFFF'0FFFULL;
/// Sets the version nibble to 0100.
inline constexpr std::uint64_t version_4_bits = 0x0000'0000'0000'4000ULL;
/// Clears the two variant bits (bits 64-65 from the top).
inline constexpr std::uint64_t variant_clear_mask = 0x3FFF'FFFF'FFFF'FFFFULL;
/// Sets the variant bits to 10 (RFC 4122).
inline constexpr std::uint64_t variant_rfc4122_bits = 0x8000'0000'0000'0000ULL;

/**
 * @brief Forces the version 4 and RFC 4122 variant bits onto a 128-bit value.
 *
 * @param high Most significant 64 bits of raw entropy
 * @param low Least significant 64 bits of raw entropy
 * @return Identifier with exactly the six version/variant bits fixed
 */
[[nodiscard]] inline auto make_version4(std::uint64_t high, std::uint64_t low) noexcept -> identifier
{
  return make_identifier((high & version_clear_mask) | version_4_bits, (low & variant_clear_mask) | variant_rfc4122_bits);
}

/**
 * @brief Generates a version 4 identifier from the given entropy source.
 *
 * Draws 128 uniformly distributed bits and forces the version and variant
 * bits. Exceptions thrown by the source propagate unchanged.
 *
 * @tparam Rng Type satisfying the entropy_source concept
 * @param rng Source of random bits, e.g. a seeded engine in tests
 * @return Freshly generated identifier
 */
template<concepts::entropy_source Rng> [[nodiscard]] auto generate(Rng &rng) -> identifier
{
  boost::random::uniform_int_distribution<std::uint64_t> bits;
  const auto high = bits(rng);
  const auto low = bits(rng);
  return make_version4(high, low);
}

/**
 * @brief Generates a version 4 identifier from the platform's secure random device.
 *
 * Each thread owns its own device, so seeding any global engine never
 * affects the output.
 *
 * @return Freshly generated identifier
 */
[[nodiscard]] auto generate() -> identifier;

}// namespace uuid4::core
