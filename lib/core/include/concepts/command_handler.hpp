#pragma once

#include <core/events.hpp>

namespace uuid4::concepts {

/**
 * @brief Concept defining the interface for handling CLI commands.
 *
 * Types satisfying this concept must provide handle() overloads for all core command event types.
 */
template<typename T>
concept command_handler = requires(T handler,
  const core::events::generate &generate_cmd,
  const core::events::decode &decode_cmd,
  const core::events::inspect &inspect_cmd,
  const core::events::formats &formats_cmd,
  const core::events::version &version_cmd) {
  handler.handle(generate_cmd);
  handler.handle(decode_cmd);
  handler.handle(inspect_cmd);
  handler.handle(formats_cmd);
  handler.handle(version_cmd);
};

}// namespace uuid4::concepts
