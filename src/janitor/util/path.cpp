#include "janitor/util/path.hpp"

#include <cstdlib>
#include <string>
#include <system_error>

namespace janitor::util {

auto expand_user(std::string_view raw) -> std::filesystem::path {
  if (raw.empty() || raw.front() != '~') {
    return std::filesystem::path{std::string(raw)};
  }
  if (raw.size() > 1 && raw[1] != '/') {
    return std::filesystem::path{std::string(raw)};
  }
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::filesystem::path{std::string(raw)};
  }
  std::filesystem::path out{home};
  if (raw.size() > 2) {
    out /= std::string(raw.substr(2));
  }
  return out;
}

auto resolve_path(std::string_view raw, const std::filesystem::path &base)
    -> std::filesystem::path {
  auto path = expand_user(raw);
  if (path.is_relative() && !base.empty()) {
    path = base / path;
  }
  return path.lexically_normal();
}

auto final_component(const std::filesystem::path &path)
    -> std::filesystem::path {
  if (path.has_filename()) {
    return path.filename();
  }
  return path.parent_path().filename();
}

auto locate_config_file(std::string_view explicit_path)
    -> std::filesystem::path {
  if (!explicit_path.empty()) {
    return expand_user(explicit_path);
  }
  if (const char *env = std::getenv("JANITOR_CONFIG"); env && *env) {
    return expand_user(env);
  }
  for (auto candidate : kConfigCandidates) {
    auto path = expand_user(candidate);
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
      return path;
    }
  }
  return expand_user(kConfigCandidates.front());
}

} // namespace janitor::util
