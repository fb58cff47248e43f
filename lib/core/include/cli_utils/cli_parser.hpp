#pragma once

#include <CLI/CLI.hpp>
#include <charconv>
#include <core/formats.hpp>
#include <cstdlib>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>

namespace uuid4::cli_utils {

inline constexpr int default_format = 36;
inline constexpr int max_count = 1'000'000;
inline constexpr auto format_env_var = "UUID4_FORMAT";

struct cli_args
{
  bool verbose = false;
  bool quiet = false;
  bool show_version = false;
  bool strict_hyphens = false;

  bool generate_parsed = false;
  int count = 1;
  int format = 0;
  bool all_formats = false;

  bool decode_parsed = false;
  std::string decode_input;
  int expected_length = 0;

  bool inspect_parsed = false;
  std::string inspect_input;

  bool formats_parsed = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

/**
 * @brief Fills in the output format when it was not given on the command line.
 *
 * Uses UUID4_FORMAT from the environment, falling back to the canonical
 * length. An unparsable value is logged and replaced by -1 so that
 * validate_cli_args rejects it.
 */
inline auto apply_format_default(cli_args &args) -> void
{
  if (args.format != 0) { return; }

  const auto env_format = platform::get_env_value(format_env_var);
  if (not env_format) {
    args.format = default_format;
    return;
  }

  int parsed = 0;
  const auto *first = env_format->data();
  const auto *last = first + env_format->size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} or ptr != last) {
    spdlog::error("{} is not a number: {}", format_env_var, *env_format);
    args.format = -1;
    return;
  }
  args.format = parsed;
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "uuid4 - version 4 identifiers in base-62, base-36 and base-16", "uuid4" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  apply_format_default(args);

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("-q,--quiet", args.quiet, "Only log errors");
  app.add_flag("--version", args.show_version, "Show version information");
  app.require_subcommand(0, 1);

  auto *generate_cmd = app.add_subcommand("generate", "Generate version 4 identifiers");
  generate_cmd->add_option("-n,--count", args.count, "Number of identifiers")->check(CLI::Range(1, max_count));
  generate_cmd->add_option("-f,--format", args.format, "Output length: 22, 24, 25, 29, 32, 36 or 39");
  generate_cmd->add_flag("-a,--all", args.all_formats, "Print every format");
  generate_cmd->callback([&args]() { args.generate_parsed = true; });

  auto *decode_cmd = app.add_subcommand("decode", "Decode an identifier and print every format");
  decode_cmd->add_option("text", args.decode_input, "Identifier in any supported format")->required();
  decode_cmd->add_option("-f,--format", args.expected_length, "Expected length, 0 to auto-detect");
  decode_cmd->add_flag("--strict-hyphens", args.strict_hyphens, "Require hyphens at their encoded positions");
  decode_cmd->callback([&args]() { args.decode_parsed = true; });

  auto *inspect_cmd = app.add_subcommand("inspect", "Print the version of an identifier");
  inspect_cmd->add_option("text", args.inspect_input, "Identifier in any supported format")->required();
  inspect_cmd->add_flag("--strict-hyphens", args.strict_hyphens, "Require hyphens at their encoded positions");
  inspect_cmd->callback([&args]() { args.inspect_parsed = true; });

  auto *formats_cmd = app.add_subcommand("formats", "List supported formats");
  formats_cmd->callback([&args]() { args.formats_parsed = true; });
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.verbose and args.quiet) {
    spdlog::error("--verbose and --quiet are mutually exclusive");
    return false;
  }

  const bool generating =
    not(args.show_version or args.decode_parsed or args.inspect_parsed or args.formats_parsed);
  if (generating and not core::is_supported_format(args.format)) {
    spdlog::error("Invalid format: {}", args.format);
    return false;
  }

  if (args.count < 1 or args.count > max_count) {
    spdlog::error("Invalid count: {} (should be 1 to {})", args.count, max_count);
    return false;
  }

  if (args.expected_length < 0) {
    spdlog::error("Invalid expected length: {}", args.expected_length);
    return false;
  }

  if (args.decode_parsed and args.decode_input.empty()) {
    spdlog::error("Decode command requires an identifier");
    return false;
  }

  if (args.inspect_parsed and args.inspect_input.empty()) {
    spdlog::error("Inspect command requires an identifier");
    return false;
  }

  return true;
}

}// namespace uuid4::cli_utils
