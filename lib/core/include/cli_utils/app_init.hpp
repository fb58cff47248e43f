#pragma once

#include <cli_utils/cli_parser.hpp>
#include <concepts/command_handler.hpp>
#include <core/codec.hpp>
#include <core/errors.hpp>
#include <core/events.hpp>
#include <memory>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace uuid4::cli_utils {

/**
 * @brief Routes logging to stderr and applies the requested level.
 *
 * Levels from SPDLOG_LEVEL are loaded first; --verbose and --quiet override them.
 */
inline auto configure_logging(const cli_args &args) -> void
{
  auto logger = std::make_shared<spdlog::logger>("uuid4", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  spdlog::set_default_logger(logger);
  spdlog::cfg::load_env_levels();

  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
  if (args.quiet) { spdlog::set_level(spdlog::level::err); }
}

/**
 * @brief Dispatches the parsed command line to the command handler.
 *
 * Without a subcommand a single identifier is generated in the default format.
 *
 * @return true on success, false if the command failed with a codec error
 */
template<concepts::command_handler CmdHandler>
[[nodiscard]] inline auto execute_cli_command(const cli_args &args, std::shared_ptr<CmdHandler> command_handler)
  -> bool
{
  const auto hyphens = args.strict_hyphens ? core::hyphen_policy::strict : core::hyphen_policy::lenient;

  try {
    if (args.show_version) {
      command_handler->handle(core::events::version{});
    } else if (args.decode_parsed) {
      command_handler->handle(core::events::decode{
        .input = args.decode_input, .expected_length = args.expected_length, .hyphens = hyphens });
    } else if (args.inspect_parsed) {
      command_handler->handle(core::events::inspect{ .input = args.inspect_input, .hyphens = hyphens });
    } else if (args.formats_parsed) {
      command_handler->handle(core::events::formats{});
    } else {
      command_handler->handle(
        core::events::generate{ .count = args.count, .format = args.format, .all_formats = args.all_formats });
    }
  } catch (const core::codec_error &e) {
    spdlog::error("{} [{}]", e.what(), core::to_string_view(e.code()));
    return false;
  }

  return true;
}

}// namespace uuid4::cli_utils
