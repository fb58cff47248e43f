#ifndef TEST_DOUBLE_COMMAND_HANDLER_HPP
#define TEST_DOUBLE_COMMAND_HANDLER_HPP

#include <algorithm>
#include <concepts/command_handler.hpp>
#include <core/errors.hpp>
#include <core/events.hpp>
#include <string>
#include <vector>

namespace uuid4_test {

struct TestDoubleCommandHandler
{
  mutable std::vector<std::string> called_commands;
  bool throw_parse_error = false;

  template<uuid4::core::events::Command T> auto handle(const T &command) const -> void
  {
    handle_impl(command);
    if (throw_parse_error) { throw uuid4::core::parse_error("test double parse error"); }
  }

  [[nodiscard]] auto was_called(const std::string &command) const -> bool
  {
    return std::ranges::find(called_commands, command) != called_commands.end();
  }

private:
  auto handle_impl(const uuid4::core::events::generate &command) const -> void
  {
    called_commands.push_back("generate:" + std::to_string(command.count) + ":" + std::to_string(command.format) + ":"
                              + (command.all_formats ? "all" : "one"));
  }

  auto handle_impl(const uuid4::core::events::decode &command) const -> void
  {
    called_commands.push_back("decode:" + command.input + ":" + std::to_string(command.expected_length) + ":"
                              + (command.hyphens == uuid4::core::hyphen_policy::strict ? "strict" : "lenient"));
  }

  auto handle_impl(const uuid4::core::events::inspect &command) const -> void
  {
    called_commands.push_back("inspect:" + command.input + ":"
                              + (command.hyphens == uuid4::core::hyphen_policy::strict ? "strict" : "lenient"));
  }

  auto handle_impl(const uuid4::core::events::formats & /*command*/) const -> void
  {
    called_commands.push_back("formats");
  }

  auto handle_impl(const uuid4::core::events::version & /*command*/) const -> void
  {
    called_commands.push_back("version");
  }
};

static_assert(uuid4::concepts::command_handler<TestDoubleCommandHandler>);

}// namespace uuid4_test

#endif
