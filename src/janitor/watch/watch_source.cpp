#include "janitor/watch/watch_source.hpp"

#include "janitor/core/constants.hpp"
#include "janitor/util/log.hpp"

#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <string_view>
#include <system_error>

namespace janitor {
namespace {

namespace fs = std::filesystem;

constexpr std::uint32_t kDirectoryMask =
    IN_CREATE | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;
// Directories renamed within, into or out of the tree change which paths the
// watch descriptors stand for.
constexpr std::uint32_t kRecursiveMask =
    kDirectoryMask | IN_MOVED_FROM | IN_MOVED_TO;
// Close-after-write and rename-into-place are the two ways editors finish
// saving; plain IN_MODIFY would fire on half-written files.
constexpr std::uint32_t kFileMask =
    IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE | IN_DELETE_SELF |
    IN_MOVE_SELF | IN_ONLYDIR;

[[nodiscard]] auto init_inotify() -> Result<int> {
  auto fd = sys_check(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!fd) {
    log::error("Failed to initialize inotify: {}", fd.error().message());
    return fail(Error::WatchSetupFailed);
  }
  return fd;
}

[[nodiscard]] auto classify(std::uint32_t mask) -> FsEvent {
  FsEvent ev;
  if (mask & IN_CREATE) {
    ev.kind = EventKind::Create;
    ev.create_kind = (mask & IN_ISDIR) ? CreateKind::Folder : CreateKind::File;
  } else if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
    ev.kind = EventKind::Modify;
    ev.modify_kind = ModifyKind::Data;
  } else if (mask & (IN_MOVED_FROM | IN_MOVED_TO | IN_MOVE_SELF)) {
    ev.kind = EventKind::Modify;
    ev.modify_kind = ModifyKind::Name;
  } else if (mask & IN_ATTRIB) {
    ev.kind = EventKind::Modify;
    ev.modify_kind = ModifyKind::Metadata;
  } else if (mask & (IN_DELETE | IN_DELETE_SELF)) {
    ev.kind = EventKind::Remove;
  }
  return ev;
}

} // namespace

WatchSource::WatchSource(boost::asio::io_context &io, int fd, fs::path root,
                         RecursiveMode mode, std::string file_name,
                         std::uint32_t mask)
    : stream_(io, fd), root_(std::move(root)), mode_(mode),
      file_name_(std::move(file_name)), mask_(mask) {}

WatchSource::~WatchSource() {
  boost::system::error_code ec;
  stream_.cancel(ec);
  stream_.close(ec);
}

auto WatchSource::open_directory(boost::asio::io_context &io,
                                 const fs::path &dir, RecursiveMode mode)
    -> Result<std::unique_ptr<WatchSource>> {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    log::error("Cannot watch '{}': {}", dir.string(),
               ec ? ec.message() : "not a directory");
    return fail(Error::WatchSetupFailed);
  }

  auto fd = init_inotify();
  if (!fd) {
    return fail(fd.error());
  }
  // Owns the descriptor from here on, so early returns close it.
  const auto mask =
      mode == RecursiveMode::Recursive ? kRecursiveMask : kDirectoryMask;
  std::unique_ptr<WatchSource> source(
      new WatchSource(io, *fd, dir, mode, {}, mask));

  auto wd = source->add_watch(dir);
  if (!wd) {
    return fail(Error::WatchSetupFailed);
  }
  source->root_wd_ = *wd;

  if (mode == RecursiveMode::Recursive) {
    source->add_subtree(dir);
  }

  log::debug("Watching '{}' ({}, {} watch descriptor(s))", dir.string(), mode,
             source->watch_count());
  return ok(std::move(source));
}

auto WatchSource::open_file(boost::asio::io_context &io, const fs::path &file)
    -> Result<std::unique_ptr<WatchSource>> {
  auto parent = file.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  std::error_code ec;
  if (!fs::is_directory(parent, ec)) {
    log::error("Cannot watch '{}': parent directory unavailable",
               file.string());
    return fail(Error::WatchSetupFailed);
  }

  auto fd = init_inotify();
  if (!fd) {
    return fail(fd.error());
  }
  std::unique_ptr<WatchSource> source(
      new WatchSource(io, *fd, parent, RecursiveMode::NonRecursive,
                      file.filename().string(), kFileMask));

  auto wd = source->add_watch(parent);
  if (!wd) {
    return fail(Error::WatchSetupFailed);
  }
  source->root_wd_ = *wd;
  return ok(std::move(source));
}

auto WatchSource::add_watch(const fs::path &dir) -> Result<int> {
  auto wd = sys_check(
      inotify_add_watch(stream_.native_handle(), dir.c_str(), mask_));
  if (!wd) {
    log::error("Failed to add watch on '{}': {}", dir.string(),
               wd.error().message());
    return fail(wd.error());
  }
  watches_.insert_or_assign(*wd, dir);
  return wd;
}

auto WatchSource::add_subtree(const fs::path &dir) -> void {
  std::error_code ec;
  fs::recursive_directory_iterator it(
      dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    log::warn("Cannot enumerate '{}': {}", dir.string(), ec.message());
    return;
  }
  const fs::recursive_directory_iterator end{};
  while (it != end) {
    std::error_code type_ec;
    if (!it->is_symlink(type_ec) && it->is_directory(type_ec)) {
      // A sub-directory that vanished meanwhile is logged by add_watch.
      (void)add_watch(it->path());
    }
    it.increment(ec);
    if (ec) {
      log::warn("Stopped enumerating '{}': {}", dir.string(), ec.message());
      return;
    }
  }
}

auto WatchSource::drop_subtree(const fs::path &dir) -> void {
  std::vector<int> stale;
  for (const auto &[wd, watched] : watches_) {
    if (wd == root_wd_) {
      continue;
    }
    const auto diverged =
        std::mismatch(dir.begin(), dir.end(), watched.begin(), watched.end())
            .first;
    if (diverged == dir.end()) {
      stale.push_back(wd);
    }
  }
  for (const int wd : stale) {
    // The kernel may already have dropped it; IN_IGNORED for an erased wd is
    // skipped by decode().
    (void)inotify_rm_watch(stream_.native_handle(), wd);
    watches_.erase(wd);
  }
  if (!stale.empty()) {
    log::debug("Dropped {} watch(es) under '{}'", stale.size(), dir.string());
  }
}

auto WatchSource::read_events() -> Result<std::vector<FsEvent>> {
  std::vector<FsEvent> out;
  alignas(inotify_event) std::array<char, io::kEventBufferSize> buffer{};

  for (;;) {
    const auto n =
        ::read(stream_.native_handle(), buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        break;
      }
      if (errno == EINTR) {
        continue;
      }
      const auto ec = last_system_error();
      disconnected_ = true;
      log::error("Reading events for '{}' failed: {}", root_.string(),
                 ec.message());
      return fail(ec);
    }
    if (n == 0) {
      disconnected_ = true;
      break;
    }
    decode(buffer.data(), static_cast<std::size_t>(n), out);
  }
  return ok(std::move(out));
}

auto WatchSource::decode(const char *buf, std::size_t len,
                         std::vector<FsEvent> &out) -> void {
  std::size_t offset = 0;
  while (offset < len) {
    const auto *event = reinterpret_cast<const inotify_event *>(buf + offset);
    offset += sizeof(inotify_event) + event->len;

    if (event->mask & IN_Q_OVERFLOW) {
      out.push_back(FsEvent{.rescan = true});
      continue;
    }

    auto it = watches_.find(event->wd);
    if (it == watches_.end()) {
      continue;
    }
    const fs::path dir = it->second;

    if (event->mask & IN_IGNORED) {
      watches_.erase(it);
      if (event->wd == root_wd_) {
        log::debug("Root watch on '{}' was removed", root_.string());
        disconnected_ = true;
      }
      continue;
    }

    const std::string_view name =
        event->len > 0 ? std::string_view{event->name} : std::string_view{};
    if (!file_name_.empty() && name != file_name_) {
      continue;
    }

    const fs::path path = name.empty() ? dir : dir / name;
    if (mode_ == RecursiveMode::Recursive && (event->mask & IN_ISDIR)) {
      if (event->mask & IN_MOVED_FROM) {
        drop_subtree(path);
      } else if ((event->mask & (IN_CREATE | IN_MOVED_TO)) &&
                 add_watch(path)) {
        add_subtree(path);
      }
    }

    auto ev = classify(event->mask);
    ev.paths.push_back(path);
    out.push_back(std::move(ev));
  }
}

} // namespace janitor
