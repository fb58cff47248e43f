#include <core/identifier.hpp>

#include <boost/uuid/uuid_io.hpp>
#include <cstddef>

namespace uuid4::core {

namespace {

  constexpr std::size_t half_size = 8;
  constexpr unsigned bits_per_byte = 8;

  auto read_half(const identifier &id, std::size_t offset) noexcept -> std::uint64_t
  {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < half_size; ++i) { value = (value << bits_per_byte) | id.data[offset + i]; }
    return value;
  }

  auto write_half(identifier &id, std::size_t offset, std::uint64_t value) noexcept -> void
  {
    for (std::size_t i = half_size; i > 0; --i) {
      id.data[offset + i - 1] = static_cast<std::uint8_t>(value & 0xFFU);
      value >>= bits_per_byte;
    }
  }

}// namespace

auto make_identifier(std::uint64_t high, std::uint64_t low) noexcept -> identifier
{
  identifier id{};
  write_half(id, 0, high);
  write_half(id, half_size, low);
  return id;
}

auto high_bits(const identifier &id) noexcept -> std::uint64_t { return read_half(id, 0); }

auto low_bits(const identifier &id) noexcept -> std::uint64_t { return read_half(id, half_size); }

auto to_string(const identifier &id) -> std::string { return boost::uuids::to_string(id); }

}// namespace uuid4::core
