#include "janitor/watch/supervisor.hpp"

#include "janitor/core/constants.hpp"
#include "janitor/util/log.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include <utility>

namespace janitor {

Supervisor::Supervisor(std::filesystem::path config_path, SnapshotPtr snapshot,
                       EventDispatcher dispatcher)
    : work_(boost::asio::make_work_guard(io_)),
      config_path_(std::move(config_path)), active_(std::move(snapshot)),
      dispatcher_(std::move(dispatcher)) {}

Supervisor::~Supervisor() {
  // Sources cancel their pending waits; the handlers are discarded with io_.
  slots_.clear();
  config_source_.reset();
}

auto Supervisor::build_slots(const ConfigSnapshot &snapshot)
    -> Result<std::vector<WatchSlot>> {
  std::vector<WatchSlot> slots;
  slots.reserve(snapshot.watches().size());
  for (const auto &spec : snapshot.watches()) {
    auto source = WatchSource::open_directory(io_, spec.path,
                                              spec.recursive_mode);
    if (!source) {
      return fail(source.error());
    }
    slots.push_back(WatchSlot{.source = std::move(*source), .spec = spec});
  }
  return ok(std::move(slots));
}

auto Supervisor::start() -> Result<void> {
  if (!active_) {
    return fail(Error::InvalidState);
  }

  auto config_source = WatchSource::open_file(io_, config_path_);
  if (!config_source) {
    log::error("Cannot watch configuration file '{}'", config_path_.string());
    return fail(config_source.error());
  }

  auto slots = build_slots(*active_);
  if (!slots) {
    return fail(slots.error());
  }

  config_source_ = std::move(*config_source);
  slots_ = std::move(*slots);
  ++generation_;
  arm_config();
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    arm(i);
  }

  log::info("Watching {} path(s) with {} bucket(s); configuration '{}'",
            slots_.size(), active_->buckets().size(), config_path_.string());
  return ok();
}

auto Supervisor::arm(std::size_t index) -> void {
  slots_[index].source->async_wait(
      [this, index, generation = generation_](
          const boost::system::error_code &ec) {
        if (generation != generation_ ||
            ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (ec) {
          log::error("Waiting on '{}' failed: {}",
                     slots_[index].spec.path.string(), ec.message());
          mark_dead(index);
          return;
        }
        ready_.push_back(index);
      });
}

auto Supervisor::arm_config() -> void {
  config_source_->async_wait([this](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (ec) {
      log::error("Waiting on configuration file failed: {}", ec.message());
      return;
    }
    config_ready_ = true;
  });
}

auto Supervisor::mark_dead(std::size_t index) -> void {
  slots_[index].alive = false;
  dead_.insert(index);
}

auto Supervisor::check_config() -> void {
  if (!config_ready_ || !config_source_) {
    return;
  }
  config_ready_ = false;

  auto events = config_source_->read_events();
  bool modified = false;
  if (events) {
    for (const auto &event : *events) {
      log::trace("Configuration file event: {} ({})", event.kind,
                 event.modify_kind);
      if (!event.rescan && event.kind == EventKind::Modify) {
        modified = true;
      }
    }
  }

  if (config_source_->disconnected()) {
    log::info("Configuration file watch on '{}': {}; reloads are disabled",
              config_path_.string(),
              make_error_code(Error::SourceDisconnected).message());
    config_source_.reset();
  } else {
    arm_config();
  }

  if (!modified) {
    return;
  }
  log::warn("Config file '{}' has been modified", config_path_.string());
  if (!reload()) {
    log::warn("config is not loaded, please fix the configuration file; "
              "keeping the previous one");
  }
}

auto Supervisor::reload() -> Result<void> {
  std::string diagnostic;
  auto candidate = ConfigLoader::load_from_file(config_path_, &diagnostic);
  if (!candidate) {
    log::error("Reloading '{}' failed: {}", config_path_.string(),
               diagnostic.empty() ? candidate.error().message() : diagnostic);
    return fail(candidate.error());
  }

  // Records already queued on the current sources were produced under the
  // current snapshot and are routed by it. Done before the new sources exist
  // so no entry is reported by both.
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    if (!dead_.contains(i) && !deliver(slots_[i], *active_)) {
      mark_dead(i);
    }
  }

  auto slots = build_slots(**candidate);
  if (!slots) {
    log::error("Reloading '{}' failed: cannot set up watches: {}",
               config_path_.string(), slots.error().message());
    return fail(slots.error());
  }

  ++generation_;
  slots_ = std::move(*slots);
  dead_.clear();
  ready_.clear();
  active_ = std::move(*candidate);
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    arm(i);
  }

  ++reload_count_;
  log::info("Configuration reloaded: {} watch(es), {} bucket(s)",
            active_->watches().size(), active_->buckets().size());
  return ok();
}

auto Supervisor::deliver(WatchSlot &slot, const ConfigSnapshot &snapshot)
    -> bool {
  auto events = slot.source->read_events();
  if (events) {
    for (const auto &event : *events) {
      (void)dispatcher_.handle_event(event, slot.spec, snapshot);
    }
  }

  if (!events || slot.source->disconnected()) {
    log::info("Watch source for '{}': {}", slot.spec.path.string(),
              make_error_code(Error::SourceDisconnected).message());
    return false;
  }
  return true;
}

auto Supervisor::service_slot(std::size_t index) -> void {
  if (index >= slots_.size() || dead_.contains(index)) {
    return;
  }
  // Held locally: dispatch must finish against the snapshot it started with.
  const auto snapshot = active_;
  if (!deliver(slots_[index], *snapshot)) {
    mark_dead(index);
    return;
  }
  arm(index);
}

auto Supervisor::poll_once(std::chrono::milliseconds timeout) -> void {
  if (io_.stopped()) {
    io_.restart();
  }
  (void)io_.poll();
  check_config();

  if (ready_.empty()) {
    (void)io_.run_one_for(timeout);
  }
  if (ready_.empty()) {
    return;
  }
  const auto index = ready_.front();
  ready_.pop_front();
  service_slot(index);
}

auto Supervisor::run(const std::atomic<bool> &stop_requested) -> void {
  while (!stop_requested.load(std::memory_order_acquire)) {
    poll_once(timing::kSelectTimeout);
  }
  log::info("Supervisor stopped");
}

} // namespace janitor
