#include <aoilog/parse/panel_builder.hpp>
#include <aoilog/parse/component_information.hpp>
#include <aoilog/parse/global_information.hpp>
#include <aoilog/parse/pcb_information.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <string>

namespace aoilog::parse {

namespace {

std::string station_name(std::string_view line_name, core::DocumentKind kind) {
  std::string station(line_name);
  station += kind == core::DocumentKind::Repair ? kRepairStationSuffix : kAoiAxiStationSuffix;
  return station;
}

void normalize_boards(std::vector<core::Board>& boards) {
  std::stable_sort(boards.begin(), boards.end(),
                   [](const core::Board& a, const core::Board& b) { return a.serial < b.serial; });
  for (std::size_t i = 0; i < boards.size(); ++i) {
    boards[i].position = i + 1;
  }
}

}  // namespace

std::expected<core::Panel, core::ParseError> build_panel(const pugi::xml_node& root,
                                                         std::string_view line_name) {
  auto global = read_global_information(root);
  if (!global) return std::unexpected(global.error());
  if (auto valid = check_global_information(*global); !valid) {
    return std::unexpected(valid.error());
  }

  auto pcb = read_pcb_information(root);
  if (!pcb) return std::unexpected(pcb.error());

  const WindowScan scan = select_window_scan(global->kind, pcb->any_failed);
  if (scan == WindowScan::Repair) {
    spdlog::debug("XML is for repair station. Searching for repair information");
  } else if (scan == WindowScan::FailedAoiAxi) {
    spdlog::debug("XML is for AOI/AXI station. Searching for failed windows.");
  }
  auto marks = read_component_information(root, scan, pcb->boards.size());
  if (!marks) return std::unexpected(marks.error());

  core::Panel panel;
  panel.program = std::move(global->program);
  panel.operator_name = std::move(global->operator_name);
  panel.kind = global->kind;
  panel.inspection_time = global->inspection_time.value_or(core::DateTime{});
  panel.repair_time = global->repair_time.value_or(core::DateTime{});
  panel.boards = std::move(pcb->boards);
  apply_defect_marks(panel.boards, *marks);

  normalize_boards(panel.boards);
  panel.station = station_name(line_name, panel.kind);
  return panel;
}

std::expected<core::Panel, core::ParseError> parse_panel(std::string_view xml_text,
                                                         std::string_view line_name,
                                                         std::string_view source) {
  pugi::xml_document doc;
  const pugi::xml_parse_result parsed = doc.load_buffer(xml_text.data(), xml_text.size());
  if (!parsed) {
    core::ParseError err{core::ParseErrorKind::MalformedXml, std::string(source), {}, {},
                         std::string(parsed.description()) + " at offset " +
                             std::to_string(parsed.offset)};
    spdlog::error("{}", core::describe(err));
    return std::unexpected(std::move(err));
  }

  auto panel = build_panel(doc.document_element(), line_name);
  if (!panel) {
    core::ParseError err = panel.error();
    err.source = std::string(source);
    spdlog::error("{}", core::describe(err));
    return std::unexpected(std::move(err));
  }
  return panel;
}

std::expected<core::Panel, core::ParseError> parse_panel_file(const std::filesystem::path& path,
                                                              std::string_view line_name) {
  spdlog::info("Processing XML: {}", path.string());

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    core::ParseError err{core::ParseErrorKind::ReadFailed, path.string(), {}, {},
                         "could not open file"};
    spdlog::error("{}", core::describe(err));
    return std::unexpected(std::move(err));
  }
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

  auto panel = parse_panel(text, line_name, path.string());
  if (panel) spdlog::info("Processing OK.");
  return panel;
}

}  // namespace aoilog::parse
