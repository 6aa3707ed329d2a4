#include "janitor/bucket/bucket.hpp"

#include "janitor/util/encoding.hpp"
#include "janitor/util/log.hpp"
#include "janitor/util/path.hpp"

#include <algorithm>
#include <utility>

namespace janitor {

Bucket::Bucket(BucketSpec spec, std::vector<std::regex> name_regexes)
    : spec_(std::move(spec)), name_regexes_(std::move(name_regexes)) {
  extensions_.insert(spec_.extension_filters.begin(),
                     spec_.extension_filters.end());
}

auto Bucket::create(BucketSpec spec) -> Result<Bucket> {
  std::vector<std::regex> regexes;
  regexes.reserve(spec.name_filters.size());
  for (const auto &pattern : spec.name_filters) {
    try {
      regexes.emplace_back(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error &e) {
      log::error("Bucket '{}': invalid name filter '{}': {}", spec.name,
                 pattern, e.what());
      return fail(Error::ParseError);
    }
  }
  return Bucket(std::move(spec), std::move(regexes));
}

auto Bucket::fits(const std::filesystem::path &path) const -> bool {
  const auto file_name = util::final_component(path).string();
  if (file_name.empty() || !util::is_valid_utf8(file_name)) {
    return false;
  }

  const auto extension = std::filesystem::path{file_name}.extension().string();
  if (!extension.empty() &&
      extensions_.contains(extension.substr(1))) {
    return true;
  }

  try {
    return std::ranges::any_of(name_regexes_, [&](const std::regex &re) {
      return std::regex_search(file_name, re);
    });
  } catch (const std::regex_error &e) {
    log::warn("Bucket '{}': name filter gave up on '{}': {}", spec_.name,
              file_name, e.what());
    return false;
  }
}

auto bucket_less(const Bucket &lhs, const Bucket &rhs) noexcept -> bool {
  if (lhs.priority() != rhs.priority()) {
    return lhs.priority() < rhs.priority();
  }
  return lhs.name() < rhs.name();
}

auto select_bucket(std::span<const Bucket *const> candidates)
    -> const Bucket * {
  if (candidates.empty()) {
    return nullptr;
  }
  return *std::ranges::max_element(
      candidates, [](const Bucket *lhs, const Bucket *rhs) {
        return bucket_less(*lhs, *rhs);
      });
}

} // namespace janitor
