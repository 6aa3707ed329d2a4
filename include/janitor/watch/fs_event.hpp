#pragma once

#include "janitor/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace janitor {

enum class EventKind : std::uint8_t { Create, Modify, Remove, Other };
BOOST_DESCRIBE_ENUM(EventKind, Create, Modify, Remove, Other)
JANITOR_DEFINE_ENUM_SERDE(EventKind)

enum class CreateKind : std::uint8_t { File, Folder, Any };
BOOST_DESCRIBE_ENUM(CreateKind, File, Folder, Any)
JANITOR_DEFINE_ENUM_SERDE(CreateKind)

enum class ModifyKind : std::uint8_t { Data, Name, Metadata, Any };
BOOST_DESCRIBE_ENUM(ModifyKind, Data, Name, Metadata, Any)
JANITOR_DEFINE_ENUM_SERDE(ModifyKind)

// One decoded change notification. `rescan` marks a queue overflow: the
// backend lost events and carries no paths.
struct FsEvent {
  EventKind kind{EventKind::Other};
  CreateKind create_kind{CreateKind::Any};
  ModifyKind modify_kind{ModifyKind::Any};
  std::vector<std::filesystem::path> paths;
  bool rescan{false};
};

} // namespace janitor
