#include <platform/env_utils.hpp>

#include <cstdlib>
#include <mutex>

#ifdef _WIN32
#include <memory>
#endif

namespace uuid4::platform {

auto get_env_value(const std::string &name) -> std::optional<std::string>
{
#ifdef _WIN32
  char *value_raw = nullptr;
  size_t len = 0;
  if (_dupenv_s(&value_raw, &len, name.c_str()) == 0 and value_raw != nullptr) {
    const std::unique_ptr<char, decltype(&free)> value(value_raw, &free);
    if (*value != '\0') { return std::string(value.get()); }
  }
  return std::nullopt;
#else
  static std::mutex env_mutex;
  const std::scoped_lock lock(env_mutex);

  const char *value = std::getenv(name.c_str());// NOLINT(concurrency-mt-unsafe)
  if (value == nullptr or *value == '\0') { return std::nullopt; }
  return std::string(value);
#endif
}

}// namespace uuid4::platform
