#include "janitor/config/config.hpp"
#include "janitor/config/toml_util.hpp"

#include "janitor/util/log.hpp"
#include "janitor/util/path.hpp"

#include <format>
#include <string>
#include <system_error>
#include <utility>

namespace janitor {
namespace detail {

struct WatchToml {
  std::string path;
  std::string recursive_mode{"non-recursive"};
  std::vector<std::string> bucket_names;
};

struct BucketToml {
  std::string name;
  std::string destination;
  std::vector<std::string> extension_filters;
  std::vector<std::string> name_filters;
  std::uint32_t priority{0};
  std::string action{"move"};
  std::string override_action{"skip"};
};

struct ConfigToml {
  std::vector<WatchToml> watch;
  std::vector<BucketToml> bucket;
};

} // namespace detail
} // namespace janitor

namespace glz {
template <> struct meta<janitor::detail::WatchToml> {
  using T = janitor::detail::WatchToml;
  static constexpr auto value =
      object("path", &T::path, "recursive_mode", &T::recursive_mode,
             "bucket_names", &T::bucket_names);
};

template <> struct meta<janitor::detail::BucketToml> {
  using T = janitor::detail::BucketToml;
  static constexpr auto value = object(
      "name", &T::name, "destination", &T::destination, "extension_filters",
      &T::extension_filters, "name_filters", &T::name_filters, "priority",
      &T::priority, "action", &T::action, "override_action",
      &T::override_action);
};

template <> struct meta<janitor::detail::ConfigToml> {
  using T = janitor::detail::ConfigToml;
  static constexpr auto value = object("watch", &T::watch, "bucket", &T::bucket);
};
} // namespace glz

namespace janitor {

ConfigSnapshot::ConfigSnapshot(std::vector<WatchSpec> watches,
                               std::vector<Bucket> buckets)
    : watches_(std::move(watches)), buckets_(std::move(buckets)) {
  by_name_.reserve(buckets_.size());
  for (std::size_t i = 0; i < buckets_.size(); ++i) {
    by_name_.emplace(buckets_[i].name(), i);
  }
}

auto ConfigSnapshot::find_bucket(std::string_view name) const
    -> const Bucket * {
  auto it = by_name_.find(std::string(name));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return &buckets_[it->second];
}

auto ConfigSnapshot::candidates_for(const WatchSpec &watch) const
    -> std::vector<const Bucket *> {
  std::vector<const Bucket *> out;
  out.reserve(watch.bucket_names.size());
  for (const auto &name : watch.bucket_names) {
    if (const auto *bucket = find_bucket(name)) {
      out.push_back(bucket);
    }
  }
  return out;
}

namespace {

// Records the first validation problem for the caller and the log.
[[nodiscard]] auto reject(std::string *diagnostic, std::string message)
    -> std::unexpected<std::error_code> {
  log::error("Invalid configuration: {}", message);
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
  return fail(Error::ParseError);
}

[[nodiscard]] auto convert_bucket(detail::BucketToml &raw,
                                  const std::filesystem::path &base_dir,
                                  std::string *diagnostic) -> Result<Bucket> {
  if (raw.name.empty()) {
    return reject(diagnostic, "bucket without a name");
  }

  auto action = parse<Action>(raw.action);
  if (!action) {
    return reject(diagnostic, std::format("bucket '{}': unknown action '{}'",
                                          raw.name, raw.action));
  }
  auto override_action = parse<OverrideAction>(raw.override_action);
  if (!override_action) {
    return reject(diagnostic,
                  std::format("bucket '{}': unknown override_action '{}'",
                              raw.name, raw.override_action));
  }
  if (raw.destination.empty() && *action != Action::Delete) {
    return reject(diagnostic, std::format("bucket '{}': {} needs a destination",
                                          raw.name, *action));
  }

  BucketSpec spec{
      .name = std::move(raw.name),
      .destination = raw.destination.empty()
                         ? std::filesystem::path{}
                         : util::resolve_path(raw.destination, base_dir),
      .extension_filters = std::move(raw.extension_filters),
      .name_filters = std::move(raw.name_filters),
      .priority = raw.priority,
      .action = *action,
      .override_action = *override_action,
  };
  const auto name = spec.name;
  auto bucket = Bucket::create(std::move(spec));
  if (!bucket) {
    return reject(diagnostic,
                  std::format("bucket '{}': invalid name filter", name));
  }
  return bucket;
}

[[nodiscard]] auto convert_watch(detail::WatchToml &raw,
                                 const std::filesystem::path &base_dir,
                                 std::string *diagnostic) -> Result<WatchSpec> {
  if (raw.path.empty()) {
    return reject(diagnostic, "watch entry without a path");
  }
  auto mode = parse<RecursiveMode>(raw.recursive_mode);
  if (!mode) {
    return reject(diagnostic,
                  std::format("watch '{}': unknown recursive_mode '{}'",
                              raw.path, raw.recursive_mode));
  }
  return ok(WatchSpec{.path = util::resolve_path(raw.path, base_dir),
                      .recursive_mode = *mode,
                      .bucket_names = std::move(raw.bucket_names)});
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                const std::filesystem::path &base_dir,
                                std::string *diagnostic)
    -> Result<SnapshotPtr> {
  auto raw_result =
      toml_util::parse_toml<detail::ConfigToml>(toml_text, diagnostic);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  std::vector<Bucket> buckets;
  buckets.reserve(raw.bucket.size());
  ankerl::unordered_dense::set<std::string> names;
  for (auto &raw_bucket : raw.bucket) {
    if (!names.insert(raw_bucket.name).second) {
      return reject(diagnostic, std::format("duplicate bucket name '{}'",
                                            raw_bucket.name));
    }
    auto bucket = convert_bucket(raw_bucket, base_dir, diagnostic);
    if (!bucket)
      return fail(bucket.error());
    buckets.push_back(std::move(*bucket));
  }

  std::vector<WatchSpec> watches;
  watches.reserve(raw.watch.size());
  for (auto &raw_watch : raw.watch) {
    auto watch = convert_watch(raw_watch, base_dir, diagnostic);
    if (!watch)
      return fail(watch.error());
    for (const auto &name : watch->bucket_names) {
      if (!names.contains(name)) {
        log::warn("Watch '{}' references unknown bucket '{}'",
                  watch->path.string(), name);
      }
    }
    watches.push_back(std::move(*watch));
  }

  return ok(std::make_shared<const ConfigSnapshot>(std::move(watches),
                                                   std::move(buckets)));
}

} // namespace

auto ConfigLoader::load_from_file(const std::filesystem::path &path,
                                  std::string *diagnostic)
    -> Result<SnapshotPtr> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read configuration '{}': {}", path.string(),
               text.error().message());
    if (diagnostic) {
      *diagnostic = text.error().message();
    }
    return fail(text.error());
  }
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  return load_from_string(*text, ec ? path.parent_path() : absolute.parent_path(),
                          diagnostic);
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    const std::filesystem::path &base_dir,
                                    std::string *diagnostic)
    -> Result<SnapshotPtr> {
  try {
    return convert_toml(toml_str, base_dir, diagnostic);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML configuration: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

} // namespace janitor
