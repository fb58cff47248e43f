#pragma once

#include <concepts/entropy_source.hpp>
#include <concepts/printer.hpp>
#include <core/codec.hpp>
#include <core/events.hpp>
#include <core/formats.hpp>
#include <core/generator.hpp>
#include <core/inspector.hpp>
#include <memory>
#include <spdlog/spdlog.h>
#include <utility>

#include "internal_use_only/config.hpp"

namespace uuid4::core {

/**
 * @brief Handles typed command events and writes their results to a printer.
 *
 * @tparam Printer Type satisfying the printer concept
 * @tparam Rng Type satisfying the entropy_source concept, used by generate
 *
 * Codec errors are not caught here; they propagate to the caller, which
 * decides how to report them.
 */
template<concepts::printer Printer, concepts::entropy_source Rng> struct command_handler
{
  /**
   * @brief Constructs a command handler.
   *
   * @param printer Output sink
   * @param rng Entropy source for generated identifiers
   */
  explicit command_handler(std::shared_ptr<Printer> printer, std::shared_ptr<Rng> rng)
    : printer_(std::move(printer)), rng_(std::move(rng))
  {}

  /**
   * @brief Handles a typed command event.
   *
   * @tparam T Command type satisfying the Command concept
   * @param command The command to handle
   */
  template<events::Command T> auto handle(const T &command) const -> void { handle_impl(command); }

private:
  std::shared_ptr<Printer> printer_;
  std::shared_ptr<Rng> rng_;

  auto print_renderings(const identifier &id) const -> void
  {
    for (const auto &[length, text] : encode(id)) { printer_->print("{:>2}: {}\n", length, text); }
  }

  auto handle_impl(const events::generate &command) const -> void
  {
    spdlog::debug("[command_handler] generate count={} format={} all={}",
      command.count,
      command.format,
      command.all_formats);

    if (command.all_formats) {
      for (int i = 0; i < command.count; ++i) {
        if (i > 0) { printer_->print("\n"); }
        print_renderings(core::generate(*rng_));
      }
      return;
    }

    const auto &layout = format_of(command.format);
    for (int i = 0; i < command.count; ++i) {
      printer_->print("{}\n", encode(core::generate(*rng_), layout.length));
    }
  }

  auto handle_impl(const events::decode &command) const -> void
  {
    spdlog::debug("[command_handler] decode input={} expected_length={}", command.input, command.expected_length);

    const auto result = core::decode(command.input, command.expected_length, command.hyphens);
    printer_->print("format: {}\n", result.length);
    printer_->print("canonical: {}\n", core::to_string(result.id));
    printer_->print("version: {}\n", version_of(result.id));
    printer_->print("variant: {:#04b}\n", variant_of(result.id));
    print_renderings(result.id);
  }

  auto handle_impl(const events::inspect &command) const -> void
  {
    spdlog::debug("[command_handler] inspect input={}", command.input);
    printer_->print("{}\n", version_of(command.input, command.hyphens));
  }

  auto handle_impl(const events::formats & /*command*/) const -> void
  {
    spdlog::debug("[command_handler] formats");
    for (const auto &layout : format_table) {
      printer_->print("{:>2}  base-{:<2}  {:<15}  {}\n",
        layout.length,
        layout.base,
        grouping_of(layout),
        layout.case_sensitive ? "case-sensitive" : "case-insensitive");
    }
  }

  auto handle_impl(const events::version & /*command*/) const -> void
  {
    printer_->print("{} v{}\n", cmake::project_name, cmake::project_version);
  }
};

}// namespace uuid4::core
