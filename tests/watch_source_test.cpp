#include "janitor/watch/watch_source.hpp"

#include "test_utils.hpp"

#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

#include "gtest/gtest.h"

using namespace janitor;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

class WatchSourceTest : public janitor::test::TempDirTest {
protected:
  // Waits for readiness and drains, until something arrives or time runs out.
  auto next_events(WatchSource &source,
                   std::chrono::milliseconds timeout = 2000ms)
      -> std::vector<FsEvent> {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    // Shared with the handler: a wait may outlive this call.
    auto ready = std::make_shared<bool>(false);
    bool armed = false;
    while (std::chrono::steady_clock::now() < deadline) {
      if (!armed) {
        *ready = false;
        source.async_wait([ready](const boost::system::error_code &ec) {
          *ready = !ec;
        });
        armed = true;
      }
      io_.restart();
      (void)io_.run_one_for(std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()));
      if (!*ready) {
        continue;
      }
      armed = false;
      auto events = source.read_events();
      if (!events) {
        return {};
      }
      if (!events->empty()) {
        return std::move(*events);
      }
    }
    return {};
  }

  static auto find_create(const std::vector<FsEvent> &events,
                          const fs::path &path) -> const FsEvent * {
    auto it = std::ranges::find_if(events, [&](const FsEvent &ev) {
      return ev.kind == EventKind::Create && !ev.paths.empty() &&
             ev.paths.front() == path;
    });
    return it == events.end() ? nullptr : &*it;
  }

  boost::asio::io_context io_;
};

TEST_F(WatchSourceTest, OpenMissingDirectoryFails) {
  auto source = WatchSource::open_directory(io_, root_ / "absent",
                                            RecursiveMode::NonRecursive);
  ASSERT_FALSE(source.has_value());
  EXPECT_EQ(source.error(), make_error_code(Error::WatchSetupFailed));
}

TEST_F(WatchSourceTest, OpenRegularFileAsDirectoryFails) {
  auto file = write_file("plain.txt");
  auto source =
      WatchSource::open_directory(io_, file, RecursiveMode::NonRecursive);
  EXPECT_FALSE(source.has_value());
}

TEST_F(WatchSourceTest, ReportsCreatedFile) {
  auto source =
      WatchSource::open_directory(io_, root_, RecursiveMode::NonRecursive);
  ASSERT_TRUE(source.has_value());
  EXPECT_EQ((*source)->watch_count(), 1u);

  auto file = write_file("new.txt");
  auto events = next_events(**source);
  const auto *created = find_create(events, file);
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(created->create_kind, CreateKind::File);
  EXPECT_FALSE(created->rescan);
}

TEST_F(WatchSourceTest, ReportsCreatedDirectoryAsFolder) {
  auto source =
      WatchSource::open_directory(io_, root_, RecursiveMode::NonRecursive);
  ASSERT_TRUE(source.has_value());

  auto dir = make_dir("sub");
  auto events = next_events(**source);
  const auto *created = find_create(events, dir);
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(created->create_kind, CreateKind::Folder);
}

TEST_F(WatchSourceTest, NonRecursiveIgnoresNestedEntries) {
  make_dir("sub");
  auto source =
      WatchSource::open_directory(io_, root_, RecursiveMode::NonRecursive);
  ASSERT_TRUE(source.has_value());

  write_file("sub/deep.txt");
  EXPECT_TRUE(next_events(**source, 300ms).empty());
}

TEST_F(WatchSourceTest, RecursiveCoversExistingAndNewSubdirectories) {
  make_dir("a/b");
  auto source =
      WatchSource::open_directory(io_, root_, RecursiveMode::Recursive);
  ASSERT_TRUE(source.has_value());
  EXPECT_EQ((*source)->watch_count(), 3u);

  auto deep = write_file("a/b/deep.txt");
  ASSERT_NE(find_create(next_events(**source), deep), nullptr);

  auto fresh = make_dir("fresh");
  ASSERT_NE(find_create(next_events(**source), fresh), nullptr);
  auto inner = write_file("fresh/inner.txt");
  ASSERT_NE(find_create(next_events(**source), inner), nullptr);
}

TEST_F(WatchSourceTest, RecursiveWatchesDirectoryMovedIn) {
  auto inbox = make_dir("D");
  make_dir("outside/x/nested");
  auto source =
      WatchSource::open_directory(io_, inbox, RecursiveMode::Recursive);
  ASSERT_TRUE(source.has_value());
  ASSERT_EQ((*source)->watch_count(), 1u);

  fs::rename(root_ / "outside/x", inbox / "x");
  auto moved = next_events(**source);
  ASSERT_FALSE(moved.empty());
  // Arrives as a rename, so nothing is routed for it.
  EXPECT_EQ(find_create(moved, inbox / "x"), nullptr);
  EXPECT_EQ((*source)->watch_count(), 3u);

  auto inside = write_file("D/x/new.txt");
  ASSERT_NE(find_create(next_events(**source), inside), nullptr);
  auto deeper = write_file("D/x/nested/deep.txt");
  ASSERT_NE(find_create(next_events(**source), deeper), nullptr);
}

TEST_F(WatchSourceTest, RecursiveFollowsRenamedSubdirectory) {
  auto inbox = make_dir("D");
  make_dir("D/old/inner");
  auto source =
      WatchSource::open_directory(io_, inbox, RecursiveMode::Recursive);
  ASSERT_TRUE(source.has_value());
  ASSERT_EQ((*source)->watch_count(), 3u);

  fs::rename(inbox / "old", inbox / "new");
  (void)next_events(**source);
  EXPECT_EQ((*source)->watch_count(), 3u);

  auto file = write_file("D/new/f.txt");
  auto events = next_events(**source);
  ASSERT_NE(find_create(events, file), nullptr);
  EXPECT_EQ(find_create(events, inbox / "old/f.txt"), nullptr);

  auto inner = write_file("D/new/inner/g.txt");
  ASSERT_NE(find_create(next_events(**source), inner), nullptr);
}

TEST_F(WatchSourceTest, RecursiveForgetsDirectoryMovedOut) {
  auto inbox = make_dir("D");
  make_dir("D/leaving/sub");
  make_dir("outside");
  auto source =
      WatchSource::open_directory(io_, inbox, RecursiveMode::Recursive);
  ASSERT_TRUE(source.has_value());
  ASSERT_EQ((*source)->watch_count(), 3u);

  fs::rename(inbox / "leaving", root_ / "outside/leaving");
  (void)next_events(**source);
  EXPECT_EQ((*source)->watch_count(), 1u);

  write_file("outside/leaving/h.txt");
  write_file("outside/leaving/sub/i.txt");
  EXPECT_TRUE(next_events(**source, 300ms).empty());
  EXPECT_FALSE((*source)->disconnected());
}

TEST_F(WatchSourceTest, RemovingRootDisconnects) {
  auto dir = make_dir("doomed");
  auto source =
      WatchSource::open_directory(io_, dir, RecursiveMode::NonRecursive);
  ASSERT_TRUE(source.has_value());
  EXPECT_FALSE((*source)->disconnected());

  fs::remove_all(dir);
  (void)next_events(**source, 500ms);
  EXPECT_TRUE((*source)->disconnected());
}

TEST_F(WatchSourceTest, FileSourceSeesSavesOfThatFileOnly) {
  auto config = write_file("janitor.toml", "a = 1");
  auto source = WatchSource::open_file(io_, config);
  ASSERT_TRUE(source.has_value());

  write_file("other.toml", "b = 2");
  EXPECT_TRUE(next_events(**source, 300ms).empty());

  std::ofstream(config) << "a = 2";
  auto events = next_events(**source);
  ASSERT_FALSE(events.empty());
  EXPECT_TRUE(std::ranges::any_of(events, [&](const FsEvent &ev) {
    return ev.kind == EventKind::Modify && ev.paths.front() == config;
  }));
}

TEST_F(WatchSourceTest, FileSourceSeesReplaceByRename) {
  auto config = write_file("janitor.toml", "a = 1");
  auto source = WatchSource::open_file(io_, config);
  ASSERT_TRUE(source.has_value());

  auto tmp = write_file("janitor.toml.tmp", "a = 3");
  (void)next_events(**source, 200ms);
  fs::rename(tmp, config);

  auto events = next_events(**source);
  EXPECT_TRUE(std::ranges::any_of(events, [](const FsEvent &ev) {
    return ev.kind == EventKind::Modify && ev.modify_kind == ModifyKind::Name;
  }));
}
