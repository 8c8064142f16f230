#include <aoilog/parse/pcb_information.hpp>
#include <aoilog/parse/field_extractors.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace aoilog::parse {

namespace {

constexpr const char* kSection = "PCBInformation";
constexpr const char* kPassResult = "PASS";

}  // namespace

std::expected<PcbInformation, core::ParseError> read_pcb_information(
    const pugi::xml_node& root) {
  PcbInformation out;
  const pugi::xml_node pcb_info = find_child(root, kSection);
  if (!pcb_info) return out;

  const std::size_t count = element_count(pcb_info);
  spdlog::debug("PCB count: {}", count);
  out.boards.resize(count);

  std::size_t i = 0;
  for (pugi::xml_node child = pcb_info.first_child(); child; child = child.next_sibling()) {
    if (child.type() != pugi::node_element || local_name(child) != "SinglePCB") continue;

    std::string serial = child_text(child, "Barcode");
    std::string result = child_text(child, "Result");
    spdlog::debug("{}: serial: {}, result: {}", i, serial, result);

    if (serial.empty() || result.empty()) {
      return std::unexpected(core::ParseError{
          core::ParseErrorKind::MissingField, {}, kSection,
          serial.empty() ? "SinglePCB/Barcode" : "SinglePCB/Result",
          "SinglePCB #" + std::to_string(i) + " sub-fields missing"});
    }
    if (i >= out.boards.size()) {
      return std::unexpected(core::ParseError{core::ParseErrorKind::InconsistentBoard, {},
                                              kSection, "SinglePCB",
                                              "more SinglePCB entries than declared"});
    }
    if (result != kPassResult) out.any_failed = true;

    out.boards[i].serial = std::move(serial);
    out.boards[i].result = std::move(result);
    ++i;
  }

  for (std::size_t slot = 0; slot < out.boards.size(); ++slot) {
    const core::Board& board = out.boards[slot];
    if (board.serial.empty() || board.result.empty()) {
      return std::unexpected(core::ParseError{
          core::ParseErrorKind::InconsistentBoard, {}, kSection, {},
          "board slot " + std::to_string(slot) + " has no serial or result"});
    }
  }
  return out;
}

}  // namespace aoilog::parse
