#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace uuid4_test {

/**
 * @brief Entropy source that replays a fixed sequence of 64-bit words.
 *
 * Covers the full 64-bit range, so each draw of a 64-bit distribution
 * consumes exactly one word unchanged.
 */
class test_double_entropy_source
{
public:
  using result_type = std::uint64_t;

  explicit test_double_entropy_source(std::vector<result_type> words = { 0 }) : words_(std::move(words)) {}

  static constexpr auto min() -> result_type { return std::numeric_limits<result_type>::min(); }
  static constexpr auto max() -> result_type { return std::numeric_limits<result_type>::max(); }

  auto operator()() -> result_type
  {
    const auto word = words_.at(calls_ % words_.size());
    ++calls_;
    return word;
  }

  [[nodiscard]] auto call_count() const -> std::size_t { return calls_; }

private:
  std::vector<result_type> words_;
  std::size_t calls_ = 0;
};

/// Entropy source whose every draw fails.
class test_double_failing_entropy_source
{
public:
  using result_type = std::uint32_t;

  static constexpr auto min() -> result_type { return 0; }
  static constexpr auto max() -> result_type { return std::numeric_limits<result_type>::max(); }

  // cppcheck-suppress functionStatic
  auto operator()() -> result_type { throw std::runtime_error("entropy source exhausted"); }
};

}// namespace uuid4_test
