#pragma once

#include "janitor/core/error.hpp"

#include <boost/interprocess/sync/file_lock.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

namespace janitor {

// Set by SIGINT/SIGTERM once setup_signal_handlers() ran.
extern std::atomic<bool> g_shutdown_requested;

// Exclusive lock on a pid file for the lifetime of the guard. The file holds
// the current pid and is removed on release.
class PidFileGuard {
public:
  PidFileGuard() = default;
  ~PidFileGuard();

  PidFileGuard(const PidFileGuard &) = delete;
  auto operator=(const PidFileGuard &) -> PidFileGuard & = delete;
  PidFileGuard(PidFileGuard &&other) noexcept;
  auto operator=(PidFileGuard &&other) noexcept -> PidFileGuard &;

  // AlreadyExists when another process holds the lock.
  [[nodiscard]] static auto acquire(std::string_view path)
      -> Result<PidFileGuard>;

  [[nodiscard]] auto path() const noexcept -> const std::string & {
    return path_;
  }

private:
  PidFileGuard(std::string path,
               std::unique_ptr<boost::interprocess::file_lock> lock) noexcept;
  auto release() noexcept -> void;

  std::string path_;
  std::unique_ptr<boost::interprocess::file_lock> lock_;
};

// Double fork, setsid, chdir("/"). Standard streams are closed, so the
// logger must already point at a file.
[[nodiscard]] auto daemonize() -> Result<void>;

void setup_signal_handlers();

} // namespace janitor
