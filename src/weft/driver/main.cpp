#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"
#include "weft/common/internal_error.hpp"

namespace {

namespace fs = std::filesystem;

// Log to stderr so dumps on stdout stay clean.
void SetupLogging(bool verbose) {
  auto logger = spdlog::stderr_color_mt("weft");
  logger->set_pattern("%^[%l]%$ %v");
  spdlog::set_default_logger(std::move(logger));
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("weft", "0.1.0");
  program.add_description(
      "Parameter lowering for native library bindings");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log analysis decisions");

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Print the lowered parameters of each function");
  dump_cmd.add_argument("--function")
      .help("Only this function (binding name or native symbol)")
      .metavar("name");
  weft::driver::AddInputFlags(dump_cmd);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description(
      "Analyze every function and report unresolved conversions and unused "
      "configuration");
  weft::driver::AddInputFlags(check_cmd);

  program.add_subparser(dump_cmd);
  program.add_subparser(check_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    weft::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  SetupLogging(program.get<bool>("--verbose"));

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      weft::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    if (program.is_subcommand_used("dump")) {
      return weft::driver::DumpCommand(dump_cmd);
    }
    if (program.is_subcommand_used("check")) {
      return weft::driver::CheckCommand(check_cmd);
    }
  } catch (const weft::common::InternalError& e) {
    weft::driver::PrintError(e.what());
    return 2;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
