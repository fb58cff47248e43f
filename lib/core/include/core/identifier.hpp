#pragma once

#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <string>

namespace uuid4::core {

/**
 * @brief A 128-bit identifier stored as 16 big-endian bytes (RFC 4122 byte order).
 *
 * Equality, ordering and hashing come from boost::uuids::uuid.
 */
using identifier = boost::uuids::uuid;

/**
 * @brief Builds an identifier from the two 64-bit halves of its 128-bit value.
 *
 * @param high Most significant 64 bits
 * @param low Least significant 64 bits
 * @return Identifier whose value is (high << 64) | low
 */
[[nodiscard]] auto make_identifier(std::uint64_t high, std::uint64_t low) noexcept -> identifier;

/// Most significant 64 bits of the 128-bit value.
[[nodiscard]] auto high_bits(const identifier &id) noexcept -> std::uint64_t;

/// Least significant 64 bits of the 128-bit value.
[[nodiscard]] auto low_bits(const identifier &id) noexcept -> std::uint64_t;

/**
 * @brief Canonical 36 character rendering.
 *
 * @return Lowercase 8-4-4-4-12 hex string, e.g. "7a052949-c101-4ca3-9a7e-43a2532b2fa8"
 */
[[nodiscard]] auto to_string(const identifier &id) -> std::string;

}// namespace uuid4::core
