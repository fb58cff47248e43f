#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace uuid4::core {

/// Failure categories of the codec.
enum class codec_errc {
  invalid_format,///< Requested format length is zero, negative or unsupported
  length_mismatch,///< Input length differs from the expected length
  unsupported_length,///< Input length matches no supported format
  parse_error,///< Input contains characters outside the format's alphabet
};

/**
 * @brief Returns a short name for an error category.
 *
 * @param code Error category
 * @return Name such as "invalid_format"
 */
[[nodiscard]] constexpr auto to_string_view(codec_errc code) noexcept -> std::string_view
{
  switch (code) {
  case codec_errc::invalid_format:
    return "invalid_format";
  case codec_errc::length_mismatch:
    return "length_mismatch";
  case codec_errc::unsupported_length:
    return "unsupported_length";
  case codec_errc::parse_error:
    return "parse_error";
  }
  return "unknown";
}

/**
 * @brief Base class of every error thrown by the encode/decode operations.
 *
 * Callers that only care about success can catch codec_error; callers that
 * distinguish categories can catch the derived types or inspect code().
 */
class codec_error : public std::runtime_error
{
public:
  codec_error(codec_errc code, const std::string &message) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] auto code() const noexcept -> codec_errc { return code_; }

private:
  codec_errc code_;
};

class invalid_format : public codec_error
{
public:
  explicit invalid_format(const std::string &message) : codec_error(codec_errc::invalid_format, message) {}
};

class length_mismatch : public codec_error
{
public:
  explicit length_mismatch(const std::string &message) : codec_error(codec_errc::length_mismatch, message) {}
};

class unsupported_length : public codec_error
{
public:
  explicit unsupported_length(const std::string &message) : codec_error(codec_errc::unsupported_length, message) {}
};

class parse_error : public codec_error
{
public:
  explicit parse_error(const std::string &message) : codec_error(codec_errc::parse_error, message) {}
};

}// namespace uuid4::core
