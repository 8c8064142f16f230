#pragma once

#include <aoilog/core/board.hpp>
#include <aoilog/core/error.hpp>
#include <pugixml.hpp>
#include <expected>
#include <vector>

namespace aoilog::parse {

/// Boards enumerated by <PCBInformation>, in document order.
struct PcbInformation {
  std::vector<core::Board> boards;
  /// True if any board result is not "PASS".
  bool any_failed{false};
};

/// Read <PCBInformation> under root; an absent section yields no boards.
/// The board list is sized by the section's element count and filled from its
/// <SinglePCB> children. Any slot left without serial or result fails the document.
[[nodiscard]] std::expected<PcbInformation, core::ParseError> read_pcb_information(
    const pugi::xml_node& root);

}  // namespace aoilog::parse
