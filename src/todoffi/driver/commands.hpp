#pragma once

#include <argparse/argparse.hpp>

namespace todoffi::driver {

// Each command returns the process exit code.
auto DemoCommand(const argparse::ArgumentParser& cmd) -> int;
auto ListCommand(const argparse::ArgumentParser& cmd) -> int;
auto StressCommand(const argparse::ArgumentParser& cmd) -> int;
auto VersionCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace todoffi::driver
