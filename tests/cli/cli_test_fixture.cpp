#include "tests/cli/cli_test_fixture.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <utility>

namespace todoffi::test {
namespace {

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// Execute command and capture output
// Uses popen to capture combined stdout/stderr
auto ExecuteCommand(const std::string& cmd) -> std::pair<int, std::string> {
  std::string output;
  std::array<char, 4096> buffer{};

  FILE* pipe = popen(cmd.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, "Failed to execute command"};
  }

  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    output += buffer.data();
  }

  int status = pclose(pipe);
  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  return {exit_code, output};
}

}  // namespace

void CliTestFixture::SetUp() {
  // Create unique test directory
  auto tmp = std::filesystem::temp_directory_path();
  test_dir_ = tmp / ("todoffi_cli_test_" + GenerateRandomSuffix());
  std::filesystem::create_directories(test_dir_);

  // TODOFFI_BIN overrides the binary the build registered
  if (const char* bin = std::getenv("TODOFFI_BIN")) {
    todoffi_bin_ = bin;
  } else {
    todoffi_bin_ = TODOFFI_CLI_PATH;
  }
}

void CliTestFixture::TearDown() {
  // Clean up test directory
  if (!test_dir_.empty() && std::filesystem::exists(test_dir_)) {
    std::filesystem::remove_all(test_dir_);
  }
}

auto CliTestFixture::Run(std::initializer_list<std::string> args)
    -> CliResult {
  return Run(std::vector<std::string>(args));
}

auto CliTestFixture::Run(const std::vector<std::string>& args) -> CliResult {
  // Build command string
  std::ostringstream cmd;
  cmd << "cd '" << test_dir_.string() << "' && '" << todoffi_bin_.string()
      << "'";
  for (const auto& arg : args) {
    // Simple escaping for shell
    cmd << " '" << arg << "'";
  }
  // Redirect stderr to stdout so we capture both
  cmd << " 2>&1";

  auto [exit_code, output] = ExecuteCommand(cmd.str());
  return CliResult{.exit_code = exit_code, .output = output};
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  if (!out) {
    throw std::runtime_error("Failed to create file: " + full_path.string());
  }
  out << content;
}

void CliTestFixture::WriteRuntimeConfig(
    const std::string& body, const std::filesystem::path& relative_dir) {
  WriteFile(relative_dir / "todoffi.toml", "[runtime]\n" + body);
}

}  // namespace todoffi::test
