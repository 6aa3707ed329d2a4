#include "janitor/bucket/action_executor.hpp"

#include "janitor/util/log.hpp"
#include "janitor/util/path.hpp"

#include <string>
#include <system_error>

namespace janitor {
namespace {

namespace fs = std::filesystem;

[[nodiscard]] auto entry_status(const fs::path &path) -> Result<fs::file_status> {
  std::error_code ec;
  auto status = fs::symlink_status(path, ec);
  if (status.type() == fs::file_type::not_found) {
    return ok(status);
  }
  if (ec) {
    return fail(ec);
  }
  return ok(status);
}

[[nodiscard]] auto same_entry(const fs::path &lhs, const fs::path &rhs)
    -> bool {
  std::error_code ec;
  return fs::equivalent(lhs, rhs, ec) && !ec;
}

[[nodiscard]] auto remove_entry(const fs::path &path, bool is_file)
    -> Result<void> {
  std::error_code ec;
  if (is_file) {
    if (!fs::remove(path, ec) && !ec) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
  } else {
    const auto removed = fs::remove_all(path, ec);
    if (removed == 0 && !ec) {
      ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
  }
  if (ec) {
    return fail(ec);
  }
  return ok();
}

[[nodiscard]] auto copy_entry(const fs::path &source, const fs::path &target,
                              bool is_file, bool overwrite) -> Result<void> {
  std::error_code ec;
  if (is_file) {
    fs::copy_file(source, target,
                  overwrite ? fs::copy_options::overwrite_existing
                            : fs::copy_options::none,
                  ec);
  } else {
    auto options = fs::copy_options::recursive | fs::copy_options::copy_symlinks;
    if (overwrite) {
      options |= fs::copy_options::overwrite_existing;
    }
    fs::copy(source, target, options, ec);
  }
  if (ec) {
    return fail(ec);
  }
  return ok();
}

[[nodiscard]] auto move_entry(const fs::path &source, const fs::path &target,
                              bool is_file) -> Result<void> {
  std::error_code ec;
  fs::rename(source, target, ec);
  if (!ec) {
    return ok();
  }
  if (ec != std::errc::cross_device_link) {
    return fail(ec);
  }

  log::debug("'{}' and '{}' are on different devices, copying instead",
             source.string(), target.string());
  return copy_entry(source, target, is_file, true).and_then([&] {
    return remove_entry(source, is_file);
  });
}

} // namespace

auto destination_for(const Bucket &bucket, const fs::path &source)
    -> fs::path {
  return bucket.destination() / util::final_component(source);
}

auto find_free_name(const fs::path &destination) -> Result<fs::path> {
  for (std::size_t n = 1;; ++n) {
    fs::path candidate = destination;
    candidate += "." + std::to_string(n);
    auto status = entry_status(candidate);
    if (!status) {
      return fail(status.error());
    }
    if (!fs::exists(*status)) {
      return ok(std::move(candidate));
    }
  }
}

auto apply_action(const Bucket &bucket, const fs::path &source, bool is_file)
    -> Result<ActionReport> {
  if (bucket.action() == Action::Delete) {
    if (auto r = remove_entry(source, is_file); !r) {
      return fail(r.error());
    }
    log::info("Deleted '{}' (bucket '{}')", source.string(), bucket.name());
    return ok(ActionReport{.outcome = ActionOutcome::Applied,
                           .destination = {}});
  }

  auto target = destination_for(bucket, source);
  auto target_status = entry_status(target);
  if (!target_status) {
    return fail(target_status.error());
  }

  if (fs::exists(*target_status)) {
    // A file routed onto itself would otherwise be renamed or removed and
    // re-reported forever.
    if (same_entry(source, target)) {
      log::info("Skipping '{}': it already is its own destination",
                source.string());
      return ok(ActionReport{.outcome = ActionOutcome::Skipped,
                             .destination = std::move(target)});
    }

    switch (bucket.override_action()) {
    case OverrideAction::Skip:
      log::info("Skipping '{}': destination '{}' already exists",
                source.string(), target.string());
      return ok(ActionReport{.outcome = ActionOutcome::Skipped,
                             .destination = std::move(target)});
    case OverrideAction::Rename: {
      auto free_name = find_free_name(target);
      if (!free_name) {
        return fail(free_name.error());
      }
      log::info("Renaming '{}': destination '{}' exists, using '{}'",
                source.string(), target.string(), free_name->string());
      target = std::move(*free_name);
      break;
    }
    case OverrideAction::Overwrite:
      // rename(2) and copy_file replace a plain file in place; anything
      // involving a directory has to be cleared first.
      if (!is_file || fs::is_directory(*target_status)) {
        if (auto r = remove_entry(target, false); !r) {
          return fail(r.error());
        }
      }
      log::info("Overwriting '{}' with '{}'", target.string(),
                source.string());
      break;
    }
  }

  const bool overwrite =
      bucket.override_action() == OverrideAction::Overwrite;
  switch (bucket.action()) {
  case Action::Move:
    if (auto r = move_entry(source, target, is_file); !r) {
      return fail(r.error());
    }
    log::info("Moved '{}' -> '{}' (bucket '{}')", source.string(),
              target.string(), bucket.name());
    break;
  case Action::Copy:
    if (auto r = copy_entry(source, target, is_file, overwrite); !r) {
      return fail(r.error());
    }
    log::info("Copied '{}' -> '{}' (bucket '{}')", source.string(),
              target.string(), bucket.name());
    break;
  case Action::Delete:
    return fail(Error::InvalidState);
  }

  return ok(ActionReport{.outcome = ActionOutcome::Applied,
                         .destination = std::move(target)});
}

} // namespace janitor
