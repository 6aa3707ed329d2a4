#include "janitor/watch/event_dispatcher.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace janitor;
namespace fs = std::filesystem;

namespace {

struct Call {
  std::string bucket;
  fs::path path;
  bool is_file;
};

auto snapshot_from(std::string_view toml, const fs::path &base)
    -> SnapshotPtr {
  auto snapshot = ConfigLoader::load_from_string(toml, base);
  if (!snapshot) {
    throw std::runtime_error("invalid config fixture");
  }
  return std::move(*snapshot);
}

} // namespace

class EventDispatcherTest : public janitor::test::TempDirTest {
protected:
  auto recording_dispatcher() -> EventDispatcher {
    return EventDispatcher(
        [this](const Bucket &bucket, const fs::path &path,
               bool is_file) -> Result<ActionReport> {
          calls_.push_back(Call{bucket.name(), path, is_file});
          if (fail_next_) {
            fail_next_ = false;
            return fail(std::make_error_code(std::errc::permission_denied));
          }
          return ok(ActionReport{.outcome = ActionOutcome::Applied,
                                 .destination = destination_for(bucket, path)});
        });
  }

  auto count_calls(bool is_file) const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(
        calls_, [&](const Call &c) { return c.is_file == is_file; }));
  }

  std::vector<Call> calls_;
  bool fail_next_{false};
};

TEST_F(EventDispatcherTest, OneShotNonRecursiveDispatchesEachEntryOnce) {
  make_dir("in/d1/nested");
  make_dir("in/d2");
  write_file("in/a.txt");
  write_file("in/b.txt");
  write_file("in/c.bin");
  write_file("in/d1/nested/hidden.txt");

  auto snapshot = snapshot_from(R"(
[[watch]]
path = "in"
bucket_names = ["all"]

[[bucket]]
name = "all"
destination = "out"
name_filters = [".*"]
)",
                                root_);
  auto dispatcher = recording_dispatcher();
  auto stats = dispatcher.run_one_shot(*snapshot);
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->applied, 5u);

  ASSERT_EQ(calls_.size(), 5u);
  EXPECT_EQ(count_calls(true), 3u);
  EXPECT_EQ(count_calls(false), 2u);
  // Files first, then directories.
  EXPECT_TRUE(std::ranges::is_partitioned(
      calls_, [](const Call &c) { return c.is_file; }));

  std::vector<fs::path> seen;
  for (const auto &c : calls_) {
    seen.push_back(c.path);
  }
  std::ranges::sort(seen);
  EXPECT_EQ(std::ranges::adjacent_find(seen), seen.end());
  EXPECT_EQ(std::ranges::count(seen, root_ / "in/d1/nested/hidden.txt"), 0);
}

TEST_F(EventDispatcherTest, OneShotRecursiveVisitsNestedFilesOnly) {
  make_dir("in/x/y");
  write_file("in/top.txt");
  write_file("in/x/mid.txt");
  write_file("in/x/y/deep.txt");

  auto snapshot = snapshot_from(R"(
[[watch]]
path = "in"
recursive_mode = "recursive"
bucket_names = ["txt"]

[[bucket]]
name = "txt"
destination = "out"
extension_filters = ["txt"]
)",
                                root_);
  auto dispatcher = recording_dispatcher();
  auto stats = dispatcher.run_one_shot(*snapshot);
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(count_calls(true), 3u);
  EXPECT_EQ(count_calls(false), 0u);
}

TEST_F(EventDispatcherTest, ScanSkipsSymlinkedDirectoriesWhenRecursive) {
  make_dir("in/real");
  write_file("in/real/f.txt");
  fs::create_directory_symlink(root_ / "in", root_ / "in/loop");

  auto scan = scan_watch_root(WatchSpec{
      .path = root_ / "in", .recursive_mode = RecursiveMode::Recursive});
  ASSERT_TRUE(scan.has_value());
  ASSERT_EQ(scan->files.size(), 1u);
  EXPECT_EQ(scan->files[0], root_ / "in/real/f.txt");
}

TEST_F(EventDispatcherTest, ScanOfMissingRootFails) {
  auto scan = scan_watch_root(WatchSpec{.path = root_ / "absent"});
  ASSERT_FALSE(scan.has_value());
  EXPECT_EQ(scan.error(), make_error_code(Error::WatchSetupFailed));
}

TEST_F(EventDispatcherTest, UnmatchedEntriesAreCounted) {
  make_dir("in");
  write_file("in/a.txt");
  auto snapshot = snapshot_from(R"(
[[watch]]
path = "in"
bucket_names = ["pdf"]

[[bucket]]
name = "pdf"
destination = "out"
extension_filters = ["pdf"]
)",
                                root_);
  auto dispatcher = recording_dispatcher();
  auto stats = dispatcher.run_one_shot(*snapshot);
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->unmatched, 1u);
  EXPECT_TRUE(calls_.empty());
}

TEST_F(EventDispatcherTest, CreateEventRoutesToSingleFittingBucket) {
  auto snapshot = snapshot_from(R"(
[[watch]]
path = "in"
bucket_names = ["images", "docs"]

[[bucket]]
name = "images"
destination = "img"
extension_filters = ["png"]

[[bucket]]
name = "docs"
destination = "doc"
extension_filters = ["pdf"]
)",
                                root_);
  const auto &watch = snapshot->watches()[0];
  auto dispatcher = recording_dispatcher();

  FsEvent event{.kind = EventKind::Create,
                .create_kind = CreateKind::File,
                .paths = {root_ / "in/report.pdf"}};
  auto stats = dispatcher.handle_event(event, watch, *snapshot);
  EXPECT_EQ(stats.applied, 1u);
  ASSERT_EQ(calls_.size(), 1u);
  EXPECT_EQ(calls_[0].bucket, "docs");
  EXPECT_TRUE(calls_[0].is_file);
}

TEST_F(EventDispatcherTest, FolderCreateIsDispatchedAsDirectory) {
  auto snapshot = snapshot_from(R"(
[[watch]]
path = "in"
bucket_names = ["any"]

[[bucket]]
name = "any"
destination = "out"
name_filters = ["."]
)",
                                root_);
  auto dispatcher = recording_dispatcher();
  FsEvent event{.kind = EventKind::Create,
                .create_kind = CreateKind::Folder,
                .paths = {root_ / "in/folder"}};
  (void)dispatcher.handle_event(event, snapshot->watches()[0], *snapshot);
  ASSERT_EQ(calls_.size(), 1u);
  EXPECT_FALSE(calls_[0].is_file);
}

TEST_F(EventDispatcherTest, NonCreateAndRescanEventsAreIgnored) {
  auto snapshot = snapshot_from(R"(
[[watch]]
path = "in"
bucket_names = ["any"]

[[bucket]]
name = "any"
destination = "out"
name_filters = ["."]
)",
                                root_);
  const auto &watch = snapshot->watches()[0];
  auto dispatcher = recording_dispatcher();

  (void)dispatcher.handle_event(
      FsEvent{.kind = EventKind::Modify,
              .modify_kind = ModifyKind::Data,
              .paths = {root_ / "in/a.txt"}},
      watch, *snapshot);
  (void)dispatcher.handle_event(
      FsEvent{.kind = EventKind::Remove, .paths = {root_ / "in/a.txt"}}, watch,
      *snapshot);
  auto stats = dispatcher.handle_event(
      FsEvent{.kind = EventKind::Create,
              .create_kind = CreateKind::File,
              .paths = {root_ / "in/a.txt"},
              .rescan = true},
      watch, *snapshot);
  EXPECT_EQ(stats.total(), 0u);
  EXPECT_TRUE(calls_.empty());
}

TEST_F(EventDispatcherTest, FailedActionDoesNotStopLaterPaths) {
  auto snapshot = snapshot_from(R"(
[[watch]]
path = "in"
bucket_names = ["any"]

[[bucket]]
name = "any"
destination = "out"
name_filters = ["."]
)",
                                root_);
  auto dispatcher = recording_dispatcher();
  fail_next_ = true;
  FsEvent event{.kind = EventKind::Create,
                .create_kind = CreateKind::File,
                .paths = {root_ / "in/first", root_ / "in/second"}};
  auto stats = dispatcher.handle_event(event, snapshot->watches()[0], *snapshot);
  EXPECT_EQ(stats.failed, 1u);
  EXPECT_EQ(stats.applied, 1u);
  EXPECT_EQ(calls_.size(), 2u);
}

TEST_F(EventDispatcherTest, DefaultDispatcherMovesForReal) {
  make_dir("in");
  make_dir("out");
  auto file = write_file("in/a.txt", "payload");
  auto snapshot = snapshot_from(R"(
[[watch]]
path = "in"
bucket_names = ["txt"]

[[bucket]]
name = "txt"
destination = "out"
extension_filters = ["txt"]
)",
                                root_);
  EventDispatcher dispatcher;
  EXPECT_EQ(dispatcher.dispatch_path(file, true, snapshot->watches()[0],
                                     *snapshot),
            DispatchOutcome::Applied);
  EXPECT_FALSE(fs::exists(file));
  EXPECT_EQ(janitor::test::read_file(root_ / "out/a.txt"), "payload");
}
