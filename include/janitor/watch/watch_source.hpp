#pragma once

#include "janitor/config/config.hpp"
#include "janitor/core/error.hpp"
#include "janitor/watch/fs_event.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace janitor {

// One inotify instance. Directory sources report entries created under a
// directory (its whole subtree when recursive, following directories moved
// in, out of or within it); file sources watch the parent
// directory and keep only events naming the file, so saves that replace the
// file by rename are still seen.
class WatchSource {
public:
  [[nodiscard]] static auto open_directory(boost::asio::io_context &io,
                                           const std::filesystem::path &dir,
                                           RecursiveMode mode)
      -> Result<std::unique_ptr<WatchSource>>;
  [[nodiscard]] static auto open_file(boost::asio::io_context &io,
                                      const std::filesystem::path &file)
      -> Result<std::unique_ptr<WatchSource>>;

  ~WatchSource();

  WatchSource(const WatchSource &) = delete;
  auto operator=(const WatchSource &) -> WatchSource & = delete;

  // Completes once the descriptor is readable, or with operation_aborted
  // when the source is destroyed first.
  template <typename Handler> auto async_wait(Handler &&handler) -> void {
    stream_.async_wait(boost::asio::posix::stream_descriptor::wait_read,
                       std::forward<Handler>(handler));
  }

  // Drains everything pending without blocking. An empty vector means
  // nothing was queued. A read failure marks the source disconnected.
  [[nodiscard]] auto read_events() -> Result<std::vector<FsEvent>>;

  // True once the kernel dropped the root watch (root deleted or unmounted)
  // or the descriptor failed.
  [[nodiscard]] auto disconnected() const noexcept -> bool {
    return disconnected_;
  }
  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path & {
    return root_;
  }
  [[nodiscard]] auto watch_count() const noexcept -> std::size_t {
    return watches_.size();
  }

private:
  WatchSource(boost::asio::io_context &io, int fd, std::filesystem::path root,
              RecursiveMode mode, std::string file_name, std::uint32_t mask);

  auto add_watch(const std::filesystem::path &dir) -> Result<int>;
  auto add_subtree(const std::filesystem::path &dir) -> void;
  // Forgets `dir` and every watched directory below it.
  auto drop_subtree(const std::filesystem::path &dir) -> void;
  auto decode(const char *buf, std::size_t len, std::vector<FsEvent> &out)
      -> void;

  boost::asio::posix::stream_descriptor stream_;
  std::filesystem::path root_;
  RecursiveMode mode_;
  // Non-empty for file sources.
  std::string file_name_;
  std::uint32_t mask_;
  ankerl::unordered_dense::map<int, std::filesystem::path> watches_;
  int root_wd_{-1};
  bool disconnected_{false};
};

} // namespace janitor
