#pragma once

#include <aoilog/core/board.hpp>
#include <aoilog/core/error.hpp>
#include <aoilog/core/panel.hpp>
#include <pugixml.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace aoilog::parse {

/// How <ComponentInformation> is interpreted for a document.
enum class WindowScan : std::uint8_t {
  Skip,          // AOI/AXI document where every board passed
  FailedAoiAxi,  // Analysis/Result codes, 1-based PCBNumber
  Repair,        // Result/ErrorDescription codes, 0-based PCBNumber
};

[[nodiscard]] WindowScan select_window_scan(core::DocumentKind kind, bool any_failed) noexcept;

enum class DefectClass : std::uint8_t {
  Genuine,
  Pseudo,
};

/// One defective window attributed to a board slot.
struct DefectMark {
  std::size_t board_index{0};
  std::string window;  // WinID with its sub-index suffix stripped
  DefectClass classification{DefectClass::Genuine};

  bool operator==(const DefectMark&) const = default;
};

/// ErrorDescription code a repair operator uses for a false call.
inline constexpr const char* kPseudoDefectCode = "Pszeudohiba";

/// Read the defect windows of <ComponentInformation> under root according to scan.
/// board_count is the number of board slots the marks may refer to.
[[nodiscard]] std::expected<std::vector<DefectMark>, core::ParseError>
read_component_information(const pugi::xml_node& root, WindowScan scan, std::size_t board_count);

/// Append each mark's window to its board's failure set, skipping duplicates.
/// Marks are expected to reference existing slots.
void apply_defect_marks(std::vector<core::Board>& boards, const std::vector<DefectMark>& marks);

}  // namespace aoilog::parse
