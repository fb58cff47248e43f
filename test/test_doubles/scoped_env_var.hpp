#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

namespace uuid4_test {

/// Sets (or unsets) an environment variable for the lifetime of the object.
class scoped_env_var
{
public:
  scoped_env_var(std::string name, const std::optional<std::string> &value) : name_(std::move(name))
  {
    if (const auto *previous = std::getenv(name_.c_str())) { previous_ = previous; }// NOLINT(concurrency-mt-unsafe)
    assign(value);
  }

  scoped_env_var(const scoped_env_var &) = delete;
  auto operator=(const scoped_env_var &) -> scoped_env_var & = delete;
  scoped_env_var(scoped_env_var &&) = delete;
  auto operator=(scoped_env_var &&) -> scoped_env_var & = delete;

  ~scoped_env_var() { assign(previous_); }

private:
  auto assign(const std::optional<std::string> &value) const -> void
  {
#ifdef _WIN32
    _putenv_s(name_.c_str(), value ? value->c_str() : "");
#else
    if (value) {
      setenv(name_.c_str(), value->c_str(), 1);// NOLINT(concurrency-mt-unsafe)
    } else {
      unsetenv(name_.c_str());// NOLINT(concurrency-mt-unsafe)
    }
#endif
  }

  std::string name_;
  std::optional<std::string> previous_;
};

}// namespace uuid4_test
