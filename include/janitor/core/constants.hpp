#pragma once

#include <chrono>
#include <cstddef>

namespace janitor {

namespace io {
// Large enough for a burst of inotify records with NAME_MAX names.
constexpr std::size_t kEventBufferSize = 16384;
} // namespace io

namespace timing {
// Upper bound on one multiplexed wait; the config file is revisited at least
// this often.
constexpr auto kSelectTimeout = std::chrono::seconds(1);
} // namespace timing

} // namespace janitor
