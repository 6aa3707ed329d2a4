#pragma once

#include "janitor/core/error.hpp"

#include <array>
#include <filesystem>
#include <string_view>

namespace janitor::util {

inline constexpr std::array<std::string_view, 3> kConfigCandidates = {
    "~/.config/janitors/config.toml",
    "~/.janitors.toml",
    "/etc/janitors/config.toml",
};

// "~" and "~/x" expand to $HOME; "~user" forms are left untouched.
[[nodiscard]] auto expand_user(std::string_view raw) -> std::filesystem::path;

// Expands "~" and anchors relative results at `base`.
[[nodiscard]] auto resolve_path(std::string_view raw,
                                const std::filesystem::path &base)
    -> std::filesystem::path;

// Last named segment, tolerating a trailing separator ("a/b/" -> "b").
[[nodiscard]] auto final_component(const std::filesystem::path &path)
    -> std::filesystem::path;

// Explicit path, then $JANITOR_CONFIG, then the first existing candidate.
// Falls back to the first candidate so the caller reports a missing file.
[[nodiscard]] auto locate_config_file(std::string_view explicit_path)
    -> std::filesystem::path;

} // namespace janitor::util
