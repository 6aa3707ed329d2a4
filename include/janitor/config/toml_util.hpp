#pragma once

#include "janitor/core/error.hpp"
#include "janitor/util/log.hpp"

#include <glaze/toml.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace janitor::toml_util {

/// Read an entire file into a string.
[[nodiscard]] inline auto read_file(const std::filesystem::path &path)
    -> Result<std::string> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return fail(Error::FileNotFound);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileOpenFailed);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Parse TOML text into a glaze-described record T.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::error("TOML parse error: {}", detail);
    if (diagnostic) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace janitor::toml_util
