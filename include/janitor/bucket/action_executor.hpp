#pragma once

#include "janitor/bucket/bucket.hpp"
#include "janitor/core/error.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>

namespace janitor {

enum class ActionOutcome : std::uint8_t { Applied, Skipped };
BOOST_DESCRIBE_ENUM(ActionOutcome, Applied, Skipped)
JANITOR_DEFINE_ENUM_SERDE(ActionOutcome)

struct ActionReport {
  ActionOutcome outcome{ActionOutcome::Applied};
  // Empty for Delete.
  std::filesystem::path destination;
};

// bucket.destination() / final segment of `source`.
[[nodiscard]] auto destination_for(const Bucket &bucket,
                                   const std::filesystem::path &source)
    -> std::filesystem::path;

// First of `destination`.1, .2, ... that does not exist.
[[nodiscard]] auto find_free_name(const std::filesystem::path &destination)
    -> Result<std::filesystem::path>;

// Applies the bucket's action under its override policy. Does not check that
// the path fits the bucket. Skip with an occupied destination leaves the
// filesystem untouched and reports Skipped. Primitive failures come back as
// the underlying system error.
[[nodiscard]] auto apply_action(const Bucket &bucket,
                                const std::filesystem::path &source,
                                bool is_file) -> Result<ActionReport>;

} // namespace janitor
