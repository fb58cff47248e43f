#include <core/codec.hpp>
#include <core/errors.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <string_view>

// Fuzzer that decodes arbitrary input and re-encodes every successful result
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string_view input(reinterpret_cast<const char *>(Data), Size);

  for (const auto policy : { uuid4::core::hyphen_policy::lenient, uuid4::core::hyphen_policy::strict }) {
    try {
      const auto result = uuid4::core::decode(input, 0, policy);
      if (uuid4::core::decode(uuid4::core::encode(result.id, result.length), result.length).id != result.id) {
        std::abort();
      }
    } catch (const uuid4::core::codec_error &) {
      continue;
    }
  }

  return 0;
}
