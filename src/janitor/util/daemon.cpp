#include "janitor/util/daemon.hpp"

#include <boost/filesystem.hpp>

#include <csignal>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace janitor {

std::atomic<bool> g_shutdown_requested{false};

namespace {

auto write_pid(const std::string &path) -> Result<void> {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return fail(Error::FileOpenFailed);
  }
  out << ::getpid() << '\n';
  out.flush();
  if (!out.good()) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

void on_shutdown_signal(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

} // namespace

PidFileGuard::PidFileGuard(
    std::string path,
    std::unique_ptr<boost::interprocess::file_lock> lock) noexcept
    : path_(std::move(path)), lock_(std::move(lock)) {}

PidFileGuard::~PidFileGuard() { release(); }

PidFileGuard::PidFileGuard(PidFileGuard &&other) noexcept
    : path_(std::move(other.path_)), lock_(std::move(other.lock_)) {}

auto PidFileGuard::operator=(PidFileGuard &&other) noexcept -> PidFileGuard & {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    lock_ = std::move(other.lock_);
  }
  return *this;
}

auto PidFileGuard::acquire(std::string_view path) -> Result<PidFileGuard> {
  if (path.empty()) {
    return fail(Error::InvalidArgument);
  }
  std::string owned(path);

  boost::system::error_code ec;
  const boost::filesystem::path parent =
      boost::filesystem::path(owned).parent_path();
  if (!parent.empty()) {
    boost::filesystem::create_directories(parent, ec);
    if (ec) {
      return fail(std::error_code(ec.value(), std::system_category()));
    }
  }
  {
    // file_lock needs an existing file.
    std::ofstream touch(owned, std::ios::app);
    if (!touch.is_open()) {
      return fail(Error::FileOpenFailed);
    }
  }

  std::unique_ptr<boost::interprocess::file_lock> lock;
  try {
    lock = std::make_unique<boost::interprocess::file_lock>(owned.c_str());
    if (!lock->try_lock()) {
      return fail(Error::AlreadyExists);
    }
  } catch (const boost::interprocess::interprocess_exception &e) {
    return fail(std::error_code(e.get_native_error(), std::system_category()));
  }

  if (auto r = write_pid(owned); !r) {
    lock->unlock();
    return fail(r.error());
  }
  return ok(PidFileGuard(std::move(owned), std::move(lock)));
}

auto PidFileGuard::release() noexcept -> void {
  if (!lock_) {
    return;
  }
  try {
    lock_->unlock();
  } catch (const boost::interprocess::interprocess_exception &) {
    // The descriptor closes with the lock object below.
  }
  lock_.reset();

  boost::system::error_code ec;
  boost::filesystem::remove(boost::filesystem::path(path_), ec);
}

auto daemonize() -> Result<void> {
  return sys_check(fork())
      .and_then([](pid_t pid) -> Result<void> {
        if (pid > 0)
          _Exit(0);
        return ok();
      })
      .and_then([]() { return sys_check(setsid()); })
      .and_then([](auto) { return sys_check(fork()); })
      .and_then([](pid_t pid) -> Result<void> {
        if (pid > 0)
          _Exit(0);
        return ok();
      })
      .and_then([]() { return sys_check(chdir("/")); })
      .and_then([](auto) -> Result<void> {
        umask(022);
        (void)close(STDIN_FILENO);
        (void)close(STDOUT_FILENO);
        (void)close(STDERR_FILENO);
        return ok();
      });
}

void setup_signal_handlers() {
  std::signal(SIGINT, on_shutdown_signal);
  std::signal(SIGTERM, on_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);
}

} // namespace janitor
