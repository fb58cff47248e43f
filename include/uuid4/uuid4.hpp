#pragma once

#include <core/codec.hpp>
#include <core/errors.hpp>
#include <core/formats.hpp>
#include <core/generator.hpp>
#include <core/identifier.hpp>
#include <core/inspector.hpp>

/**
 * @brief Public API of the uuid4 library.
 *
 * Version 4 identifier generation and conversion between the 128-bit value
 * and the seven fixed-length string formats:
 * @code
 * auto id = uuid4::generate();
 * auto text = uuid4::encode(id, 22);
 * auto [length, parsed] = uuid4::decode(text);
 * assert(parsed == id and uuid4::version_of(parsed) == 4);
 * @endcode
 */
namespace uuid4 {

using core::identifier;
using core::make_identifier;
using core::to_string;

using core::generate;

using core::decode;
using core::decode_result;
using core::encode;
using core::hyphen_policy;
using core::supported_formats;

using core::variant_of;
using core::version_of;

using core::codec_errc;
using core::codec_error;
using core::invalid_format;
using core::length_mismatch;
using core::parse_error;
using core::unsupported_length;

}// namespace uuid4
