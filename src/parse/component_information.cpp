#include <aoilog/parse/component_information.hpp>
#include <aoilog/parse/field_extractors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <optional>
#include <string_view>

namespace aoilog::parse {

namespace {

constexpr const char* kSection = "ComponentInformation";

struct Window {
  std::string win_id;
  std::string pcb_number;
  std::string result;
};

Window read_window(const pugi::xml_node& node, WindowScan scan) {
  Window w;
  w.win_id = child_text(node, "WinID");
  w.pcb_number = child_text(node, "PCBNumber");
  w.result = scan == WindowScan::Repair ? nested_text(node, "Result", "ErrorDescription")
                                        : nested_text(node, "Analysis", "Result");
  return w;
}

std::string window_context(const Window& w) {
  return "WinID: " + w.win_id + ", PCBNumber: " + w.pcb_number + ", Result: " + w.result;
}

// Unsigned decimal, whole string; one leading '+' is allowed.
std::optional<std::size_t> parse_index(std::string_view s) {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  std::size_t v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

core::ParseError window_error(core::ParseErrorKind kind, const char* field, std::string detail) {
  return core::ParseError{kind, {}, kSection, field, std::move(detail)};
}

void append_unique(std::vector<std::string>& set, const std::string& id) {
  if (std::find(set.begin(), set.end(), id) == set.end()) set.push_back(id);
}

}  // namespace

WindowScan select_window_scan(core::DocumentKind kind, bool any_failed) noexcept {
  if (kind == core::DocumentKind::Repair) return WindowScan::Repair;
  return any_failed ? WindowScan::FailedAoiAxi : WindowScan::Skip;
}

std::expected<std::vector<DefectMark>, core::ParseError>
read_component_information(const pugi::xml_node& root, WindowScan scan, std::size_t board_count) {
  std::vector<DefectMark> marks;
  if (scan == WindowScan::Skip) return marks;

  const pugi::xml_node comp_info = find_child(root, kSection);
  if (!comp_info) return marks;

  for (pugi::xml_node node = comp_info.first_child(); node; node = node.next_sibling()) {
    if (node.type() != pugi::node_element) continue;

    const Window w = read_window(node, scan);
    if (w.win_id.empty() || w.pcb_number.empty() || w.result.empty()) {
      return std::unexpected(window_error(
          core::ParseErrorKind::MissingField,
          w.win_id.empty() ? "WinID" : (w.pcb_number.empty() ? "PCBNumber" : "Result"),
          "Window interpreting error! " + window_context(w)));
    }

    // AOI/AXI marks "no defect" windows with result code 0.
    if (scan == WindowScan::FailedAoiAxi && w.result == "0") continue;

    spdlog::debug("Window found! {}", window_context(w));

    const auto number = parse_index(w.pcb_number);
    if (!number) {
      return std::unexpected(window_error(core::ParseErrorKind::UnparsableNumber, "PCBNumber",
                                          "Could not parse PCBNumber: " + w.pcb_number));
    }

    DefectMark mark;
    mark.window = strip_window_suffix(w.win_id);

    if (scan == WindowScan::Repair) {
      // Repair stations number boards from 0; unknown boards are ignored.
      if (*number >= board_count) {
        spdlog::debug("Ignoring window {} for unknown board {}", w.win_id, *number);
        continue;
      }
      mark.board_index = *number;
      mark.classification =
          w.result == kPseudoDefectCode ? DefectClass::Pseudo : DefectClass::Genuine;
    } else {
      if (*number == 0) {
        return std::unexpected(window_error(core::ParseErrorKind::BoardOutOfRange, "PCBNumber",
                                            "BoardNumber is 0. Was expecting 1+"));
      }
      if (*number > board_count) {
        return std::unexpected(window_error(core::ParseErrorKind::BoardOutOfRange, "PCBNumber",
                                            "Could not find board number " + w.pcb_number));
      }
      mark.board_index = *number - 1;
    }
    marks.push_back(std::move(mark));
  }
  return marks;
}

void apply_defect_marks(std::vector<core::Board>& boards, const std::vector<DefectMark>& marks) {
  for (const auto& mark : marks) {
    if (mark.board_index >= boards.size()) continue;
    core::Board& board = boards[mark.board_index];
    append_unique(mark.classification == DefectClass::Pseudo ? board.pseudo_failures
                                                             : board.failures,
                  mark.window);
  }
}

}  // namespace aoilog::parse
