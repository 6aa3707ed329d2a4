#include "janitor/cli/commands.hpp"
#include "janitor/config/config.hpp"
#include "janitor/util/daemon.hpp"
#include "janitor/util/log.hpp"
#include "janitor/util/path.hpp"
#include "janitor/watch/event_dispatcher.hpp"
#include "janitor/watch/supervisor.hpp"

#include <cstdlib>
#include <filesystem>
#include <print>
#include <string>

namespace janitor::cli {
namespace {

// --log-level wins over $JANITOR_LOG_LEVEL; info otherwise.
auto apply_log_level(const RunOptions &opts) -> bool {
  std::string name = "info";
  if (opts.log_level) {
    name = *opts.log_level;
  } else if (const char *env = std::getenv("JANITOR_LOG_LEVEL");
             env && *env) {
    name = env;
  }
  auto level = log::parse_level(name);
  if (!level) {
    std::println(stderr,
                 "Error: unknown log level '{}' "
                 "(trace|debug|info|warn|error)",
                 name);
    return false;
  }
  log::set_level(*level);
  return true;
}

auto apply_log_file(const RunOptions &opts) -> bool {
  if (!opts.log_file) {
    return true;
  }
  if (!log::set_output_file(*opts.log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", *opts.log_file);
    return false;
  }
  return true;
}

struct LoadedConfig {
  std::filesystem::path path;
  SnapshotPtr snapshot;
};

auto load_or_print(const RunOptions &opts) -> Result<LoadedConfig> {
  auto path = util::locate_config_file(opts.config_file);
  std::error_code ec;
  if (auto absolute = std::filesystem::absolute(path, ec); !ec) {
    path = std::move(absolute);
  }

  std::string diagnostic;
  auto snapshot = ConfigLoader::load_from_file(path, &diagnostic);
  if (!snapshot) {
    std::println(stderr, "Error: cannot load '{}': {}", path.string(),
                 diagnostic.empty() ? snapshot.error().message() : diagnostic);
    return fail(snapshot.error());
  }
  log::info("Loaded configuration '{}'", path.string());
  return ok(LoadedConfig{.path = std::move(path),
                         .snapshot = std::move(*snapshot)});
}

} // namespace

auto cmd_check(const RunOptions &opts) -> int {
  if (!apply_log_level(opts)) {
    return 1;
  }
  auto loaded = load_or_print(opts);
  if (!loaded) {
    return 1;
  }
  const auto &snapshot = *loaded->snapshot;
  std::println("{}: {} watch(es), {} bucket(s)", loaded->path.string(),
               snapshot.watches().size(), snapshot.buckets().size());
  for (const auto &watch : snapshot.watches()) {
    std::println("  watch {} ({}) -> {} bucket(s)", watch.path.string(),
                 watch.recursive_mode, watch.bucket_names.size());
  }
  for (const auto &bucket : snapshot.buckets()) {
    std::println("  bucket {} [{} / {} / priority {}] -> {}", bucket.name(),
                 bucket.action(), bucket.override_action(), bucket.priority(),
                 bucket.destination().string());
  }
  return 0;
}

auto cmd_one_shot(const RunOptions &opts) -> int {
  if (!apply_log_level(opts) || !apply_log_file(opts)) {
    return 1;
  }
  auto loaded = load_or_print(opts);
  if (!loaded) {
    return 1;
  }

  EventDispatcher dispatcher;
  auto stats = dispatcher.run_one_shot(*loaded->snapshot);
  if (!stats) {
    log::error("One-shot pass aborted: {}", stats.error().message());
    return 1;
  }
  return 0;
}

auto cmd_watch(const RunOptions &opts) -> int {
  if (!apply_log_level(opts)) {
    return 1;
  }
  if (opts.daemon && !opts.log_file) {
    std::println(stderr, "Error: --daemon requires --log-file");
    return 1;
  }
  if (!apply_log_file(opts)) {
    return 1;
  }

  // Loaded before daemonizing so errors still reach the terminal.
  auto loaded = load_or_print(opts);
  if (!loaded) {
    return 1;
  }

  if (opts.daemon) {
    if (auto r = daemonize(); !r) {
      std::println(stderr, "Error: Failed to daemonize - {}",
                   r.error().message());
      return 1;
    }
  }

  PidFileGuard pid_guard;
  if (opts.pid_file) {
    auto guard = PidFileGuard::acquire(*opts.pid_file);
    if (!guard) {
      if (guard.error() == make_error_code(Error::AlreadyExists)) {
        log::error("janitor is already running (pid file locked: {})",
                   *opts.pid_file);
      } else {
        log::error("Failed to acquire pid file '{}': {}", *opts.pid_file,
                   guard.error().message());
      }
      return 1;
    }
    pid_guard = std::move(*guard);
  }

  log::start();
  setup_signal_handlers();

  Supervisor supervisor(loaded->path, std::move(loaded->snapshot));
  if (auto r = supervisor.start(); !r) {
    log::error("Failed to start watching: {}", r.error().message());
    log::stop();
    return 1;
  }

  supervisor.run(g_shutdown_requested);
  log::info("janitor stopped.");
  log::stop();
  return 0;
}

} // namespace janitor::cli
