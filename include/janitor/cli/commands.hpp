#pragma once

#include <optional>
#include <string>

namespace janitor::cli {

struct RunOptions {
  // Empty: discovered from $JANITOR_CONFIG and the default locations.
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<std::string> pid_file;
  bool daemon{false};
};

// Continuous watch mode until SIGINT/SIGTERM.
[[nodiscard]] auto cmd_watch(const RunOptions &opts) -> int;
// Routes every pre-existing entry once and exits.
[[nodiscard]] auto cmd_one_shot(const RunOptions &opts) -> int;
// Validates the configuration and prints a summary.
[[nodiscard]] auto cmd_check(const RunOptions &opts) -> int;

} // namespace janitor::cli
