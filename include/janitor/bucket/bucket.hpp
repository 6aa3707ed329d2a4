#pragma once

#include "janitor/core/error.hpp"
#include "janitor/util/enum.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <regex>
#include <span>
#include <string>
#include <vector>

namespace janitor {

enum class Action : std::uint8_t { Move, Delete, Copy };
BOOST_DESCRIBE_ENUM(Action, Move, Delete, Copy)
JANITOR_DEFINE_ENUM_SERDE(Action)

// Policy applied when the computed destination name is already taken.
enum class OverrideAction : std::uint8_t { Overwrite, Rename, Skip };
BOOST_DESCRIBE_ENUM(OverrideAction, Overwrite, Rename, Skip)
JANITOR_DEFINE_ENUM_SERDE(OverrideAction)

struct BucketSpec {
  std::string name;
  std::filesystem::path destination;
  std::vector<std::string> extension_filters;
  std::vector<std::string> name_filters;
  std::uint32_t priority{0};
  Action action{Action::Move};
  OverrideAction override_action{OverrideAction::Skip};

  auto operator==(const BucketSpec &) const -> bool = default;
};

// A destination rule with its name filters compiled. Immutable once created.
//
// Extension filters are literal and compared against the final extension
// only: "archive.tar.gz" has extension "gz", never "tar".
class Bucket {
public:
  // Compiles every name filter; an invalid expression fails with ParseError.
  [[nodiscard]] static auto create(BucketSpec spec) -> Result<Bucket>;

  // An extension hit short-circuits; name filters are searched (unanchored)
  // only when it misses. Names that are not valid UTF-8 never fit, and a
  // search the regex engine abandons counts as no match.
  [[nodiscard]] auto fits(const std::filesystem::path &path) const -> bool;

  [[nodiscard]] auto spec() const noexcept -> const BucketSpec & {
    return spec_;
  }
  [[nodiscard]] auto name() const noexcept -> const std::string & {
    return spec_.name;
  }
  [[nodiscard]] auto destination() const noexcept
      -> const std::filesystem::path & {
    return spec_.destination;
  }
  [[nodiscard]] auto priority() const noexcept -> std::uint32_t {
    return spec_.priority;
  }
  [[nodiscard]] auto action() const noexcept -> Action { return spec_.action; }
  [[nodiscard]] auto override_action() const noexcept -> OverrideAction {
    return spec_.override_action;
  }
  [[nodiscard]] auto compiled_filter_count() const noexcept -> std::size_t {
    return name_regexes_.size();
  }

private:
  Bucket(BucketSpec spec, std::vector<std::regex> name_regexes);

  BucketSpec spec_;
  ankerl::unordered_dense::set<std::string> extensions_;
  std::vector<std::regex> name_regexes_;
};

// Priority ascending, then name ascending.
[[nodiscard]] auto bucket_less(const Bucket &lhs, const Bucket &rhs) noexcept
    -> bool;

// Maximum under bucket_less: the highest priority wins and equal priorities
// go to the lexicographically greatest name. nullptr when empty.
[[nodiscard]] auto select_bucket(std::span<const Bucket *const> candidates)
    -> const Bucket *;

} // namespace janitor
