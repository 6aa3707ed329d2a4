#pragma once

#include "janitor/bucket/action_executor.hpp"
#include "janitor/bucket/bucket.hpp"
#include "janitor/config/config.hpp"
#include "janitor/core/error.hpp"
#include "janitor/watch/fs_event.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace janitor {

enum class DispatchOutcome : std::uint8_t { NoMatch, Applied, Skipped, Failed };
BOOST_DESCRIBE_ENUM(DispatchOutcome, NoMatch, Applied, Skipped, Failed)
JANITOR_DEFINE_ENUM_SERDE(DispatchOutcome)

struct DispatchStats {
  std::size_t applied{0};
  std::size_t skipped{0};
  std::size_t unmatched{0};
  std::size_t failed{0};

  auto record(DispatchOutcome outcome) noexcept -> void;
  auto operator+=(const DispatchStats &other) noexcept -> DispatchStats &;
  [[nodiscard]] auto total() const noexcept -> std::size_t {
    return applied + skipped + unmatched + failed;
  }
};

// Candidates found by a one-shot walk of one watch root.
struct DirectoryScan {
  std::vector<std::filesystem::path> files;
  std::vector<std::filesystem::path> directories;
};

// Depth-first walk with an explicit stack. Recursive specs descend into
// sub-directories (symlinked ones excluded) and report only files;
// non-recursive specs report immediate files and immediate sub-directories
// without entering them. Fails with WatchSetupFailed when the root cannot be
// read; unreadable sub-directories are logged and skipped.
[[nodiscard]] auto scan_watch_root(const WatchSpec &watch)
    -> Result<DirectoryScan>;

// Drives Matcher -> Selector -> Executor for every path it is given. A failed
// action is logged and counted; it never stops the caller.
class EventDispatcher {
public:
  using ActionFn = std::move_only_function<Result<ActionReport>(
      const Bucket &, const std::filesystem::path &, bool)>;

  EventDispatcher();
  explicit EventDispatcher(ActionFn action);

  auto dispatch_path(const std::filesystem::path &path, bool is_file,
                     const WatchSpec &watch, const ConfigSnapshot &snapshot)
      -> DispatchOutcome;

  // Only Create events are routed; rescan notices are no-ops.
  auto handle_event(const FsEvent &event, const WatchSpec &watch,
                    const ConfigSnapshot &snapshot) -> DispatchStats;

  // Every pre-existing entry of every watch once: files first, then
  // directories, per watch.
  [[nodiscard]] auto run_one_shot(const ConfigSnapshot &snapshot)
      -> Result<DispatchStats>;

private:
  auto dispatch_all(const std::vector<std::filesystem::path> &paths,
                    bool is_file, const WatchSpec &watch,
                    const std::vector<const Bucket *> &possible)
      -> DispatchStats;
  auto dispatch_with(const std::filesystem::path &path, bool is_file,
                     const std::vector<const Bucket *> &possible)
      -> DispatchOutcome;

  ActionFn action_;
};

} // namespace janitor
