#pragma once

#include <concepts>

namespace uuid4::concepts {

/**
 * @brief Concept for a source of uniformly distributed random bits.
 *
 * Covers std engines and Boost.Random engines and devices alike. Unlike
 * std::uniform_random_bit_generator, min() and max() need not be constexpr,
 * so boost::random::random_device qualifies.
 */
template<typename T>
concept entropy_source = requires(T &rng) {
  typename T::result_type;
  { rng() } -> std::convertible_to<typename T::result_type>;
  { T::min() } -> std::convertible_to<typename T::result_type>;
  { T::max() } -> std::convertible_to<typename T::result_type>;
} and std::unsigned_integral<typename T::result_type>;

}// namespace uuid4::concepts
