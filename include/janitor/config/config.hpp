#pragma once

#include "janitor/bucket/bucket.hpp"
#include "janitor/core/error.hpp"
#include "janitor/util/enum.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace janitor {

enum class RecursiveMode : std::uint8_t { Recursive, NonRecursive };
BOOST_DESCRIBE_ENUM(RecursiveMode, Recursive, NonRecursive)
JANITOR_DEFINE_ENUM_SERDE(RecursiveMode)

struct WatchSpec {
  std::filesystem::path path;
  RecursiveMode recursive_mode{RecursiveMode::NonRecursive};
  // Referential: names of buckets eligible for entries under `path`.
  std::vector<std::string> bucket_names;

  auto operator==(const WatchSpec &) const -> bool = default;
};

// Every watch spec and every (compiled) bucket of one configuration document.
// Shared read-only between reloads and replaced as a whole.
class ConfigSnapshot {
public:
  ConfigSnapshot(std::vector<WatchSpec> watches, std::vector<Bucket> buckets);

  [[nodiscard]] auto watches() const noexcept
      -> const std::vector<WatchSpec> & {
    return watches_;
  }
  [[nodiscard]] auto buckets() const noexcept -> const std::vector<Bucket> & {
    return buckets_;
  }

  [[nodiscard]] auto find_bucket(std::string_view name) const
      -> const Bucket *;

  // Buckets referenced by `watch.bucket_names`, unknown names skipped.
  [[nodiscard]] auto candidates_for(const WatchSpec &watch) const
      -> std::vector<const Bucket *>;

private:
  std::vector<WatchSpec> watches_;
  std::vector<Bucket> buckets_;
  ankerl::unordered_dense::map<std::string, std::size_t> by_name_;
};

using SnapshotPtr = std::shared_ptr<const ConfigSnapshot>;

class ConfigLoader {
public:
  // Relative paths inside the document resolve against the file's directory.
  [[nodiscard]] static auto load_from_file(const std::filesystem::path &path,
                                           std::string *diagnostic = nullptr)
      -> Result<SnapshotPtr>;
  [[nodiscard]] static auto
  load_from_string(std::string_view toml_str,
                   const std::filesystem::path &base_dir = {},
                   std::string *diagnostic = nullptr) -> Result<SnapshotPtr>;
};

} // namespace janitor
