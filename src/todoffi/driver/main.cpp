#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "commands.hpp"
#include "print.hpp"
#include "todoffi/config/runtime_config.hpp"
#include "todoffi/runtime/logging.hpp"
#include "todoffi/sdk/todo_list.hpp"

namespace {

namespace fs = std::filesystem;

// --config wins; otherwise todoffi.toml is searched for from the current
// directory upward. No config file means defaults.
auto ApplyConfig(const argparse::ArgumentParser& program) -> bool {
  std::optional<fs::path> config_path;
  if (auto explicit_path = program.present("--config")) {
    config_path = *explicit_path;
  } else {
    config_path = todoffi::config::FindConfig();
  }
  if (!config_path) {
    return true;
  }
  if (auto loaded = todoffi::sdk::LoadRuntimeConfig(config_path->string());
      !loaded) {
    todoffi::driver::PrintError(loaded.error().message);
    return false;
  }
  return true;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("todoffi", "0.1.0");
  program.add_description("Todo list behind a C ABI (demo consumer)");
  program.add_argument("--config")
      .help("Runtime config file (default: nearest todoffi.toml)")
      .metavar("path");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log list lifecycle events to stderr");

  // Subcommand: demo
  argparse::ArgumentParser demo_cmd("demo");
  demo_cmd.add_description("Run the reference add/count/get scenario");

  // Subcommand: list
  argparse::ArgumentParser list_cmd("list");
  list_cmd.add_description("Add the given notes with ids 1..N and print them");
  list_cmd.add_argument("notes").remaining().help("Note texts");

  // Subcommand: stress
  argparse::ArgumentParser stress_cmd("stress");
  stress_cmd.add_description(
      "Create, populate, query and release lists repeatedly, then report "
      "leaks");
  stress_cmd.add_argument("--cycles")
      .default_value(1000)
      .scan<'i', int>()
      .help("Number of lists to create and release");
  stress_cmd.add_argument("--items")
      .default_value(10)
      .scan<'i', int>()
      .help("Entries added and read back per list");

  // Subcommand: version
  argparse::ArgumentParser version_cmd("version");
  version_cmd.add_description("Print the C ABI version");

  program.add_subparser(demo_cmd);
  program.add_subparser(list_cmd);
  program.add_subparser(stress_cmd);
  program.add_subparser(version_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    todoffi::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (!ApplyConfig(program)) {
    return 1;
  }
  if (program.get<bool>("--verbose")) {
    todoffi::runtime::SetLogLevel(spdlog::level::debug);
  }

  if (program.is_subcommand_used("demo")) {
    return todoffi::driver::DemoCommand(demo_cmd);
  }

  if (program.is_subcommand_used("list")) {
    return todoffi::driver::ListCommand(list_cmd);
  }

  if (program.is_subcommand_used("stress")) {
    return todoffi::driver::StressCommand(stress_cmd);
  }

  if (program.is_subcommand_used("version")) {
    return todoffi::driver::VersionCommand(version_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
