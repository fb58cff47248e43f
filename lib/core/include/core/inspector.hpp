#pragma once

#include <core/codec.hpp>
#include <core/identifier.hpp>
#include <string_view>

namespace uuid4::core {

/**
 * @brief Extracts the version nibble, bits 76-79 of the 128-bit value.
 *
 * @param id Identifier to inspect
 * @return Version in [0, 15]; 4 for generated identifiers
 */
[[nodiscard]] auto version_of(const identifier &id) noexcept -> int;

/**
 * @brief Decodes a string with format auto-detection and extracts its version.
 *
 * @param text Identifier in any supported format
 * @param policy Hyphen placement checking passed on to decode()
 * @return Version in [0, 15]
 * @throws codec_error subclasses exactly as decode() does
 */
[[nodiscard]] auto version_of(std::string_view text, hyphen_policy policy = hyphen_policy::lenient) -> int;

/**
 * @brief Extracts the two most significant variant bits, bits 62-63 of the value.
 *
 * @return 0b10 for RFC 4122 identifiers
 */
[[nodiscard]] auto variant_of(const identifier &id) noexcept -> int;

}// namespace uuid4::core
