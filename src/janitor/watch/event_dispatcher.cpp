#include "janitor/watch/event_dispatcher.hpp"

#include "janitor/util/log.hpp"

#include <system_error>
#include <utility>

namespace janitor {

namespace fs = std::filesystem;

auto DispatchStats::record(DispatchOutcome outcome) noexcept -> void {
  switch (outcome) {
  case DispatchOutcome::Applied:
    ++applied;
    break;
  case DispatchOutcome::Skipped:
    ++skipped;
    break;
  case DispatchOutcome::NoMatch:
    ++unmatched;
    break;
  case DispatchOutcome::Failed:
    ++failed;
    break;
  }
}

auto DispatchStats::operator+=(const DispatchStats &other) noexcept
    -> DispatchStats & {
  applied += other.applied;
  skipped += other.skipped;
  unmatched += other.unmatched;
  failed += other.failed;
  return *this;
}

auto scan_watch_root(const WatchSpec &watch) -> Result<DirectoryScan> {
  DirectoryScan scan;
  const bool recursive = watch.recursive_mode == RecursiveMode::Recursive;

  std::error_code root_ec;
  if (!fs::exists(watch.path, root_ec)) {
    log::error("Cannot read watch root '{}': {}", watch.path.string(),
               root_ec ? root_ec.message() : "no such file or directory");
    return fail(Error::WatchSetupFailed);
  }

  std::vector<fs::path> stack{watch.path};
  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();

    std::error_code ec;
    const auto status = fs::status(current, ec);
    if (fs::is_regular_file(status)) {
      scan.files.push_back(std::move(current));
      continue;
    }
    if (!fs::is_directory(status)) {
      continue;
    }

    fs::directory_iterator it(current, ec);
    if (ec) {
      if (current == watch.path) {
        log::error("Cannot read watch root '{}': {}", current.string(),
                   ec.message());
        return fail(Error::WatchSetupFailed);
      }
      log::warn("Skipping unreadable directory '{}': {}", current.string(),
                ec.message());
      continue;
    }

    const fs::directory_iterator end{};
    while (it != end) {
      const auto &entry = *it;
      std::error_code type_ec;
      if (recursive) {
        // Symlinked directories would let the walk loop forever.
        if (!(entry.is_symlink(type_ec) && entry.is_directory(type_ec))) {
          stack.push_back(entry.path());
        }
      } else if (entry.is_directory(type_ec)) {
        scan.directories.push_back(entry.path());
      } else if (entry.is_regular_file(type_ec)) {
        scan.files.push_back(entry.path());
      }

      it.increment(ec);
      if (ec) {
        log::warn("Stopped reading '{}': {}", current.string(), ec.message());
        break;
      }
    }
  }
  return ok(std::move(scan));
}

EventDispatcher::EventDispatcher() : action_(&apply_action) {}

EventDispatcher::EventDispatcher(ActionFn action) : action_(std::move(action)) {}

auto EventDispatcher::dispatch_with(const fs::path &path, bool is_file,
                                    const std::vector<const Bucket *> &possible)
    -> DispatchOutcome {
  std::vector<const Bucket *> fitting;
  fitting.reserve(possible.size());
  for (const auto *bucket : possible) {
    if (bucket->fits(path)) {
      fitting.push_back(bucket);
    }
  }

  const auto *winner = select_bucket(fitting);
  if (winner == nullptr) {
    log::trace("No bucket fits '{}'", path.string());
    return DispatchOutcome::NoMatch;
  }

  auto report = action_(*winner, path, is_file);
  if (!report) {
    log::error("Bucket '{}' failed to {} '{}': {}", winner->name(),
               winner->action(), path.string(), report.error().message());
    return DispatchOutcome::Failed;
  }
  return report->outcome == ActionOutcome::Applied ? DispatchOutcome::Applied
                                                   : DispatchOutcome::Skipped;
}

auto EventDispatcher::dispatch_path(const fs::path &path, bool is_file,
                                    const WatchSpec &watch,
                                    const ConfigSnapshot &snapshot)
    -> DispatchOutcome {
  return dispatch_with(path, is_file, snapshot.candidates_for(watch));
}

auto EventDispatcher::dispatch_all(const std::vector<fs::path> &paths,
                                   bool is_file, const WatchSpec &watch,
                                   const std::vector<const Bucket *> &possible)
    -> DispatchStats {
  DispatchStats stats;
  for (const auto &path : paths) {
    stats.record(dispatch_with(path, is_file, possible));
  }
  log::debug("Dispatched {} {} under '{}'", paths.size(),
             is_file ? "file(s)" : "directory(ies)", watch.path.string());
  return stats;
}

auto EventDispatcher::handle_event(const FsEvent &event, const WatchSpec &watch,
                                   const ConfigSnapshot &snapshot)
    -> DispatchStats {
  DispatchStats stats;
  if (event.rescan) {
    log::debug("Event queue overflowed under '{}'; rescan is not performed",
               watch.path.string());
    return stats;
  }
  if (event.kind != EventKind::Create || event.create_kind == CreateKind::Any) {
    return stats;
  }

  const bool is_file = event.create_kind == CreateKind::File;
  const auto possible = snapshot.candidates_for(watch);
  for (const auto &path : event.paths) {
    stats.record(dispatch_with(path, is_file, possible));
  }
  return stats;
}

auto EventDispatcher::run_one_shot(const ConfigSnapshot &snapshot)
    -> Result<DispatchStats> {
  DispatchStats total;
  for (const auto &watch : snapshot.watches()) {
    auto scan = scan_watch_root(watch);
    if (!scan) {
      return fail(scan.error());
    }
    const auto possible = snapshot.candidates_for(watch);
    total += dispatch_all(scan->files, true, watch, possible);
    total += dispatch_all(scan->directories, false, watch, possible);
  }
  log::info("One-shot pass finished: {} applied, {} skipped, {} unmatched, {} "
            "failed",
            total.applied, total.skipped, total.unmatched, total.failed);
  return ok(total);
}

} // namespace janitor
