#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>
#include <vector>

#include "test_doubles/scoped_env_var.hpp"
#include <cli_utils/cli_parser.hpp>

auto create_argv(std::vector<std::string> &args) -> std::vector<char *>
{
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) { argv.push_back(arg.data()); }
  return argv;
}

TEST_CASE("CLI parsing basic flags", "[cli_utils][cli_parser][integration]")
{
  const uuid4_test::scoped_env_var no_format(uuid4::cli_utils::format_env_var, std::nullopt);

  SECTION("version flag sets show_version")
  {
    std::vector<std::string> args = { "uuid4", "--version" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.show_version == true);
  }

  SECTION("verbose flag sets verbose")
  {
    std::vector<std::string> args = { "uuid4", "--verbose" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.verbose == true);
  }

  SECTION("short quiet flag works")
  {
    std::vector<std::string> args = { "uuid4", "-q" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.quiet == true);
  }
}

TEST_CASE("CLI parsing generate subcommand", "[cli_utils][cli_parser][integration]")
{
  const uuid4_test::scoped_env_var no_format(uuid4::cli_utils::format_env_var, std::nullopt);

  SECTION("count and format options")
  {
    std::vector<std::string> args = { "uuid4", "generate", "-n", "5", "-f", "22" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.generate_parsed == true);
    REQUIRE(parsed.count == 5);
    REQUIRE(parsed.format == 22);
    REQUIRE(parsed.all_formats == false);
  }

  SECTION("all formats flag")
  {
    std::vector<std::string> args = { "uuid4", "generate", "--all" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.generate_parsed == true);
    REQUIRE(parsed.all_formats == true);
    REQUIRE(parsed.format == uuid4::cli_utils::default_format);
  }
}

TEST_CASE("CLI parsing decode and inspect subcommands", "[cli_utils][cli_parser][integration]")
{
  const uuid4_test::scoped_env_var no_format(uuid4::cli_utils::format_env_var, std::nullopt);

  SECTION("decode with expected length and strict hyphens")
  {
    std::vector<std::string> args = { "uuid4", "decode", "3iFQCUWij0NI5SOep5eJuS", "-f", "22", "--strict-hyphens" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.decode_parsed == true);
    REQUIRE(parsed.decode_input == "3iFQCUWij0NI5SOep5eJuS");
    REQUIRE(parsed.expected_length == 22);
    REQUIRE(parsed.strict_hyphens == true);
  }

  SECTION("inspect subcommand")
  {
    std::vector<std::string> args = { "uuid4", "inspect", "7a052949-c101-4ca3-9a7e-43a2532b2fa8" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.inspect_parsed == true);
    REQUIRE(parsed.inspect_input == "7a052949-c101-4ca3-9a7e-43a2532b2fa8");
    REQUIRE(parsed.strict_hyphens == false);
  }

  SECTION("formats subcommand")
  {
    std::vector<std::string> args = { "uuid4", "formats" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.formats_parsed == true);
    REQUIRE(parsed.decode_parsed == false);
  }
}

TEST_CASE("CLI parsing defaults", "[cli_utils][cli_parser][integration]")
{
  SECTION("no arguments uses defaults")
  {
    const uuid4_test::scoped_env_var no_format(uuid4::cli_utils::format_env_var, std::nullopt);
    std::vector<std::string> args = { "uuid4" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.generate_parsed == false);
    REQUIRE(parsed.count == 1);
    REQUIRE(parsed.format == 36);
    REQUIRE(parsed.verbose == false);
  }

  SECTION("format from the environment")
  {
    const uuid4_test::scoped_env_var env_format(uuid4::cli_utils::format_env_var, "25");
    std::vector<std::string> args = { "uuid4", "generate" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.format == 25);
  }

  SECTION("command line format overrides the environment")
  {
    const uuid4_test::scoped_env_var env_format(uuid4::cli_utils::format_env_var, "25");
    std::vector<std::string> args = { "uuid4", "generate", "--format", "39" };
    auto argv = create_argv(args);

    auto parsed = uuid4::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());

    REQUIRE(parsed.format == 39);
  }
}
