#pragma once

#include <aoilog/core/board.hpp>
#include <aoilog/core/date_time.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace aoilog::core {

/// Which station produced the document. Decided once from GlobalInformation.
enum class DocumentKind : std::uint8_t {
  AoiAxi,
  Repair,
};

/// One inspected panel, built from one log document and handed to the caller by value.
struct Panel {
  std::string program;
  /// "<line>_HARAN" or "<line>_AOI_AXI"; derived, not read from the document.
  std::string station;
  /// Upper-cased repair operator; empty for AOI/AXI documents.
  std::string operator_name;
  DocumentKind kind{DocumentKind::AoiAxi};
  DateTime inspection_time{};
  DateTime repair_time{};
  std::vector<Board> boards;

  [[nodiscard]] bool is_repair() const noexcept { return kind == DocumentKind::Repair; }

  /// Timestamp the panel is recorded under: repair time for repair documents.
  [[nodiscard]] const DateTime& record_time() const noexcept {
    return is_repair() ? repair_time : inspection_time;
  }

  bool operator==(const Panel&) const = default;
};

}  // namespace aoilog::core
