#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace aoilog::core {

/// One physical PCB within a panel.
struct Board {
  std::string serial;
  /// 1-based, assigned after sorting by serial; never read from the document.
  std::size_t position{0};
  std::string result;
  /// Window ids of genuine defects, insertion order, no duplicates.
  std::vector<std::string> failures;
  /// Window ids the repair operator reclassified as false calls (repair documents only).
  std::vector<std::string> pseudo_failures;

  bool operator==(const Board&) const = default;
};

}  // namespace aoilog::core
