#pragma once

#include <aoilog/core/date_time.hpp>
#include <aoilog/core/error.hpp>
#include <aoilog/core/panel.hpp>
#include <pugixml.hpp>
#include <expected>
#include <optional>
#include <string>

namespace aoilog::parse {

/// Panel-level metadata read from <GlobalInformation>.
struct GlobalInformation {
  std::string program;
  std::string operator_name;
  core::DocumentKind kind{core::DocumentKind::AoiAxi};
  std::optional<core::DateTime> inspection_time;
  std::optional<core::DateTime> repair_time;
};

/// Read <GlobalInformation> under root. A <Repair> child makes it a repair document.
/// Fails with MissingSection when the section is absent.
[[nodiscard]] std::expected<GlobalInformation, core::ParseError> read_global_information(
    const pugi::xml_node& root);

/// Mandatory-field rules: program set, inspection time from year 2000 on,
/// and for repair documents a repair time from year 2000 on.
[[nodiscard]] std::expected<void, core::ParseError> check_global_information(
    const GlobalInformation& info);

}  // namespace aoilog::parse
