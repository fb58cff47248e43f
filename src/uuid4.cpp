#include <boost/random/random_device.hpp>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/command_handler.hpp>
#include <core/default_printer.hpp>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

namespace uuid4 {

auto main(int argc, char **argv) -> int
{
  auto args = cli_utils::parse_cli_args(argc, argv);

  cli_utils::configure_logging(args);

  if (not cli_utils::validate_cli_args(args)) { return 1; }

  using printer_t = core::default_printer;
  using rng_t = boost::random::random_device;
  using cmd_handler_t = core::command_handler<printer_t, rng_t>;

  try {
    auto command_handler = std::make_shared<cmd_handler_t>(std::make_shared<printer_t>(), std::make_shared<rng_t>());
    return cli_utils::execute_cli_command(args, command_handler) ? 0 : 1;
  } catch (const std::exception &e) {
    spdlog::critical("Unexpected error: {}", e.what());
    return 2;
  }
}

}// namespace uuid4

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int { return uuid4::main(argc, argv); }
