#pragma once

#include <optional>
#include <string>

namespace uuid4::platform {

/**
 * @brief Reads an environment variable.
 *
 * @param name Variable name
 * @return Value, or std::nullopt when the variable is unset or empty
 */
[[nodiscard]] auto get_env_value(const std::string &name) -> std::optional<std::string>;

}// namespace uuid4::platform
