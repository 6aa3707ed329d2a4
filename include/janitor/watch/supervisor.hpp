#pragma once

#include "janitor/config/config.hpp"
#include "janitor/core/error.hpp"
#include "janitor/watch/event_dispatcher.hpp"
#include "janitor/watch/watch_source.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <vector>

namespace janitor {

// Owns one WatchSource per watch spec of the active snapshot plus one for the
// configuration file, and multiplexes them on a single io_context. Everything
// runs on the thread that calls poll_once()/run().
//
// A successful reload replaces the snapshot and every slot together, after
// routing what the old slots still had queued; a failed one leaves both
// untouched.
class Supervisor {
public:
  Supervisor(std::filesystem::path config_path, SnapshotPtr snapshot,
             EventDispatcher dispatcher = EventDispatcher());
  ~Supervisor();

  Supervisor(const Supervisor &) = delete;
  auto operator=(const Supervisor &) -> Supervisor & = delete;

  // Opens the configuration source and every watch slot. Any failure is
  // fatal and leaves the supervisor unusable.
  [[nodiscard]] auto start() -> Result<void>;

  // One loop iteration: config file check, bounded wait over the live slots,
  // then the events of at most one ready slot.
  auto poll_once(std::chrono::milliseconds timeout) -> void;

  auto run(const std::atomic<bool> &stop_requested) -> void;

  [[nodiscard]] auto reload() -> Result<void>;

  [[nodiscard]] auto snapshot() const noexcept -> const SnapshotPtr & {
    return active_;
  }
  [[nodiscard]] auto slot_count() const noexcept -> std::size_t {
    return slots_.size();
  }
  [[nodiscard]] auto dead_slot_count() const noexcept -> std::size_t {
    return dead_.size();
  }
  [[nodiscard]] auto reload_count() const noexcept -> std::size_t {
    return reload_count_;
  }

private:
  struct WatchSlot {
    std::unique_ptr<WatchSource> source;
    WatchSpec spec;
    bool alive{true};
  };

  [[nodiscard]] auto build_slots(const ConfigSnapshot &snapshot)
      -> Result<std::vector<WatchSlot>>;
  auto arm(std::size_t index) -> void;
  auto arm_config() -> void;
  auto mark_dead(std::size_t index) -> void;
  auto check_config() -> void;
  auto service_slot(std::size_t index) -> void;
  // Reads and dispatches whatever the slot has queued. False once the
  // source is disconnected.
  auto deliver(WatchSlot &slot, const ConfigSnapshot &snapshot) -> bool;

  // Declared first: sources hold descriptors registered with it.
  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_;

  std::filesystem::path config_path_;
  SnapshotPtr active_;
  EventDispatcher dispatcher_;

  std::unique_ptr<WatchSource> config_source_;
  bool config_ready_{false};

  std::vector<WatchSlot> slots_;
  ankerl::unordered_dense::set<std::size_t> dead_;
  std::deque<std::size_t> ready_;
  // Bumped on every slot rebuild; completions from older slots are dropped.
  std::uint64_t generation_{0};
  std::size_t reload_count_{0};
};

} // namespace janitor
