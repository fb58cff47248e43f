#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/codec.hpp>
#include <core/generator.hpp>
#include <core/inspector.hpp>
#include <random>
#include <string>

namespace uuid4::core::test {

TEST_CASE("Identifier Generation Benchmarks", "[benchmark][generator]")
{
  BENCHMARK("Generate from the random device") { return generate(); };

  std::mt19937_64 engine(std::random_device{}());
  BENCHMARK("Generate from a seeded engine") { return generate(engine); };
}

TEST_CASE("Codec Performance Benchmarks", "[benchmark][codec]")
{
  const auto id = generate();

  SECTION("Encoding")
  {
    BENCHMARK("Encode base-62 (22)") { return encode(id, 22); };
    BENCHMARK("Encode base-36 (25)") { return encode(id, 25); };
    BENCHMARK("Encode canonical (36)") { return encode(id, 36); };
    BENCHMARK("Encode every format") { return encode(id); };
  }

  SECTION("Decoding")
  {
    const auto base62 = encode(id, 22);
    const auto base62_hyphenated = encode(id, 24);
    const auto base36 = encode(id, 25);
    const auto canonical = encode(id, 36);

    BENCHMARK("Decode base-62 (22)") { return decode(base62); };
    BENCHMARK("Decode hyphenated base-62 (24)") { return decode(base62_hyphenated); };
    BENCHMARK("Decode base-36 (25)") { return decode(base36); };
    BENCHMARK("Decode canonical (36)") { return decode(canonical); };
    BENCHMARK("Decode canonical with strict hyphens") { return decode(canonical, 36, hyphen_policy::strict); };
    BENCHMARK("Version of canonical string") { return version_of(canonical); };
  }
}

}// namespace uuid4::core::test
