#pragma once

#include <aoilog/core/error.hpp>
#include <aoilog/core/panel.hpp>
#include <pugixml.hpp>
#include <expected>
#include <filesystem>
#include <string_view>

namespace aoilog::parse {

/// Station suffixes appended to the caller's line name.
inline constexpr const char* kRepairStationSuffix = "_HARAN";
inline constexpr const char* kAoiAxiStationSuffix = "_AOI_AXI";

/// Build a Panel from the root element of an inspection log.
/// Runs GlobalInformation -> PCBInformation -> ComponentInformation and stops at the
/// first error; no partial Panel is returned. On success boards are sorted by serial,
/// numbered 1..N and the station is derived from line_name.
/// Thread-safe: touches no shared state.
[[nodiscard]] std::expected<core::Panel, core::ParseError> build_panel(const pugi::xml_node& root,
                                                                     std::string_view line_name);

/// Parse XML text and build the Panel. source is copied into any returned error.
[[nodiscard]] std::expected<core::Panel, core::ParseError> parse_panel(
    std::string_view xml_text,
    std::string_view line_name,
    std::string_view source = {});

/// Read a log file and build the Panel.
[[nodiscard]] std::expected<core::Panel, core::ParseError> parse_panel_file(
    const std::filesystem::path& path,
    std::string_view line_name);

}  // namespace aoilog::parse
