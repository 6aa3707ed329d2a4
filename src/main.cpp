#include "janitor/cli/commands.hpp"
#include "janitor/util/log.hpp"

#include <CLI/CLI.hpp>

#include <string>

int main(int argc, char *argv[]) {
  janitor::log::set_output_stderr();

  CLI::App app{"janitor", "Sorts new files into buckets as they appear"};
  app.footer("\nExamples:\n"
             "  janitor ~/.janitors.toml\n"
             "  janitor --one-shot config.toml\n"
             "  janitor -d --log-file /var/log/janitor.log "
             "--pid-file /run/janitor.pid\n"
             "\nWithout a config argument, $JANITOR_CONFIG and then "
             "~/.config/janitors/config.toml, ~/.janitors.toml and "
             "/etc/janitors/config.toml are tried.");

  janitor::cli::RunOptions opts;
  bool one_shot = false;
  bool check = false;

  app.add_option("config", opts.config_file, "Configuration file (TOML)");
  auto *one_shot_flag = app.add_flag(
      "--one-shot", one_shot,
      "Route every existing entry once and exit instead of watching");
  app.add_flag("--check", check,
               "Validate the configuration, print a summary and exit")
      ->excludes(one_shot_flag);
  app.add_option("--log-level", opts.log_level,
                 "Log level: trace|debug|info|warn|error "
                 "(default: $JANITOR_LOG_LEVEL or info)");
  app.add_option("--log-file", opts.log_file,
                 "Append log lines to this file (required for --daemon)");
  auto *daemon_flag =
      app.add_flag("-d,--daemon", opts.daemon, "Detach and run in background");
  daemon_flag->excludes(one_shot_flag);
  app.add_option("--pid-file", opts.pid_file,
                 "Lock file preventing a second instance");

  CLI11_PARSE(app, argc, argv);

  if (check) {
    return janitor::cli::cmd_check(opts);
  }
  if (one_shot) {
    return janitor::cli::cmd_one_shot(opts);
  }
  return janitor::cli::cmd_watch(opts);
}
