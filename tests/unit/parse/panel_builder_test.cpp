#include <aoilog/parse/panel_builder.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ap = aoilog::parse;
namespace ac = aoilog::core;

namespace {

constexpr const char* kAoiHeader = R"(<?xml version="1.0" encoding="UTF-8"?>
<Panel>
  <GlobalInformation>
    <Program><InspectionPlanName>MAIN_TOP</InspectionPlanName></Program>
    <Inspection>
      <Date><End>20240415</End></Date>
      <Time><End>093000</End></Time>
    </Inspection>
  </GlobalInformation>)";

constexpr const char* kRepairHeader = R"(<?xml version="1.0" encoding="UTF-8"?>
<Panel>
  <GlobalInformation>
    <Program><InspectionPlanName>MAIN_TOP</InspectionPlanName></Program>
    <Inspection>
      <Date><End>20240415</End></Date>
      <Time><End>093000</End></Time>
    </Inspection>
    <Repair>
      <OperatorName>Nagy Anna</OperatorName>
      <Date><End>20240415</End></Date>
      <Time><End>101500</End></Time>
    </Repair>
  </GlobalInformation>)";

std::string single_pcb(const char* serial, const char* result) {
  return std::string("<SinglePCB><Barcode>") + serial + "</Barcode><Result>" + result +
         "</Result></SinglePCB>";
}

std::string aoi_window(const char* win_id, const char* pcb_number, const char* result) {
  return std::string("<Window><WinID>") + win_id + "</WinID><PCBNumber>" + pcb_number +
         "</PCBNumber><Analysis><Result>" + result + "</Result></Analysis></Window>";
}

std::string repair_window(const char* win_id, const char* pcb_number, const char* code) {
  return std::string("<Window><WinID>") + win_id + "</WinID><PCBNumber>" + pcb_number +
         "</PCBNumber><Result><ErrorDescription>" + code +
         "</ErrorDescription></Result></Window>";
}

std::string document(const char* header, const std::string& pcbs, const std::string& windows) {
  std::string xml = header;
  xml += "<PCBInformation>" + pcbs + "</PCBInformation>";
  if (!windows.empty()) xml += "<ComponentInformation>" + windows + "</ComponentInformation>";
  xml += "</Panel>";
  return xml;
}

}  // namespace

TEST(PanelBuilder, MinimalPassingAoiDocument) {
  auto panel = ap::parse_panel(document(kAoiHeader, single_pcb("SN001", "PASS"), ""), "L3");
  ASSERT_TRUE(panel.has_value()) << ac::describe(panel.error());
  EXPECT_EQ(panel->program, "MAIN_TOP");
  EXPECT_EQ(panel->station, "L3_AOI_AXI");
  EXPECT_EQ(panel->kind, ac::DocumentKind::AoiAxi);
  EXPECT_TRUE(panel->operator_name.empty());
  EXPECT_EQ(panel->inspection_time, (ac::DateTime{2024, 4, 15, 9, 30, 0}));
  ASSERT_EQ(panel->boards.size(), 1u);
  EXPECT_EQ(panel->boards[0].serial, "SN001");
  EXPECT_EQ(panel->boards[0].position, 1u);
  EXPECT_TRUE(panel->boards[0].failures.empty());
  EXPECT_TRUE(panel->boards[0].pseudo_failures.empty());
}

TEST(PanelBuilder, MissingGlobalInformation) {
  auto panel = ap::parse_panel("<Panel><PCBInformation/></Panel>", "L1", "a.xml");
  ASSERT_FALSE(panel.has_value());
  EXPECT_EQ(panel.error().kind, ac::ParseErrorKind::MissingSection);
  EXPECT_EQ(panel.error().source, "a.xml");
}

TEST(PanelBuilder, EmptyInspectionDateWithoutRepair) {
  const char* xml = R"(<Panel><GlobalInformation>
      <Program><InspectionPlanName>P</InspectionPlanName></Program>
      <Inspection><Date><End></End></Date><Time><End>093000</End></Time></Inspection>
    </GlobalInformation></Panel>)";
  auto panel = ap::parse_panel(xml, "L1");
  ASSERT_FALSE(panel.has_value());
  EXPECT_EQ(panel.error().kind, ac::ParseErrorKind::InvalidTimestamp);
}

TEST(PanelBuilder, MalformedXml) {
  auto panel = ap::parse_panel("<Panel><GlobalInformation>", "L1");
  ASSERT_FALSE(panel.has_value());
  EXPECT_EQ(panel.error().kind, ac::ParseErrorKind::MalformedXml);
}

TEST(PanelBuilder, BoardsSortedBySerialAndRenumbered) {
  const std::string pcbs =
      single_pcb("SN300", "PASS") + single_pcb("SN100", "PASS") + single_pcb("SN200", "PASS");
  auto panel = ap::parse_panel(document(kRepairHeader, pcbs, ""), "L1");
  ASSERT_TRUE(panel.has_value()) << ac::describe(panel.error());
  ASSERT_EQ(panel->boards.size(), 3u);
  EXPECT_EQ(panel->boards[0].serial, "SN100");
  EXPECT_EQ(panel->boards[1].serial, "SN200");
  EXPECT_EQ(panel->boards[2].serial, "SN300");
  for (std::size_t i = 0; i < panel->boards.size(); ++i) {
    EXPECT_EQ(panel->boards[i].position, i + 1);
  }
}

TEST(PanelBuilder, DefectsFollowBoardThroughSort) {
  // Board 1 in the document (SN900) sorts last.
  const std::string pcbs = single_pcb("SN900", "FAIL") + single_pcb("SN100", "PASS");
  auto panel = ap::parse_panel(document(kAoiHeader, pcbs, aoi_window("U7-1", "1", "5")), "L2");
  ASSERT_TRUE(panel.has_value()) << ac::describe(panel.error());
  EXPECT_EQ(panel->boards[0].serial, "SN100");
  EXPECT_TRUE(panel->boards[0].failures.empty());
  EXPECT_EQ(panel->boards[1].serial, "SN900");
  EXPECT_EQ(panel->boards[1].failures, (std::vector<std::string>{"U7"}));
}

TEST(PanelBuilder, PassingAoiSkipsComponentInformation) {
  // The window is malformed and references board 0, but no board failed.
  auto panel = ap::parse_panel(
      document(kAoiHeader, single_pcb("SN001", "PASS"), aoi_window("U1", "0", "9") +
                                                            "<Window><WinID>X</WinID></Window>"),
      "L1");
  ASSERT_TRUE(panel.has_value()) << ac::describe(panel.error());
  EXPECT_TRUE(panel->boards[0].failures.empty());
}

TEST(PanelBuilder, FailedAoiBoardZeroRejected) {
  auto panel = ap::parse_panel(
      document(kAoiHeader, single_pcb("SN001", "FAIL"), aoi_window("U1", "0", "9")), "L1");
  ASSERT_FALSE(panel.has_value());
  EXPECT_EQ(panel.error().kind, ac::ParseErrorKind::BoardOutOfRange);
}

TEST(PanelBuilder, DuplicateWindowDeduplicated) {
  auto panel = ap::parse_panel(
      document(kAoiHeader, single_pcb("SN001", "FAIL"),
               aoi_window("U5-1", "1", "9") + aoi_window("U5-2", "1", "9") +
                   aoi_window("U6", "1", "0")),
      "L1");
  ASSERT_TRUE(panel.has_value()) << ac::describe(panel.error());
  EXPECT_EQ(panel->boards[0].failures, (std::vector<std::string>{"U5"}));
}

TEST(PanelBuilder, RepairPseudoDefect) {
  auto panel = ap::parse_panel(
      document(kRepairHeader, single_pcb("SN001", "PASS"),
               repair_window("C12-1", "0", "Pszeudohiba")),
      "L4");
  ASSERT_TRUE(panel.has_value()) << ac::describe(panel.error());
  EXPECT_EQ(panel->station, "L4_HARAN");
  EXPECT_EQ(panel->operator_name, "NAGY ANNA");
  EXPECT_EQ(panel->repair_time, (ac::DateTime{2024, 4, 15, 10, 15, 0}));
  EXPECT_EQ(panel->record_time(), panel->repair_time);
  ASSERT_EQ(panel->boards.size(), 1u);
  EXPECT_EQ(panel->boards[0].pseudo_failures, (std::vector<std::string>{"C12"}));
  EXPECT_TRUE(panel->boards[0].failures.empty());
}

TEST(PanelBuilder, RepairGenuineAndPseudoMixed) {
  const std::string pcbs = single_pcb("SN002", "FAIL") + single_pcb("SN001", "FAIL");
  const std::string windows = repair_window("R1-1", "0", "Hidegforrasztas") +
                              repair_window("R1-2", "0", "Hidegforrasztas") +
                              repair_window("C3", "1", "Pszeudohiba") +
                              repair_window("C4", "9", "Hidegforrasztas");
  auto panel = ap::parse_panel(document(kRepairHeader, pcbs, windows), "L1");
  ASSERT_TRUE(panel.has_value()) << ac::describe(panel.error());
  // Document slot 0 is SN002, which sorts second.
  EXPECT_EQ(panel->boards[1].serial, "SN002");
  EXPECT_EQ(panel->boards[1].failures, (std::vector<std::string>{"R1"}));
  EXPECT_EQ(panel->boards[0].serial, "SN001");
  EXPECT_EQ(panel->boards[0].pseudo_failures, (std::vector<std::string>{"C3"}));
}

TEST(PanelBuilder, RepairMissingRepairTime) {
  const char* xml = R"(<Panel><GlobalInformation>
      <Program><InspectionPlanName>P</InspectionPlanName></Program>
      <Inspection><Date><End>20240101</End></Date><Time><End>093000</End></Time></Inspection>
      <Repair><OperatorName>x</OperatorName></Repair>
    </GlobalInformation></Panel>)";
  auto panel = ap::parse_panel(xml, "L1");
  ASSERT_FALSE(panel.has_value());
  EXPECT_EQ(panel.error().kind, ac::ParseErrorKind::InvalidTimestamp);
}

TEST(PanelBuilder, NoPcbSectionYieldsEmptyPanel) {
  std::string xml = kAoiHeader;
  xml += "</Panel>";
  auto panel = ap::parse_panel(xml, "L1");
  ASSERT_TRUE(panel.has_value()) << ac::describe(panel.error());
  EXPECT_TRUE(panel->boards.empty());
}

TEST(PanelBuilder, MissingFileIsReadFailure) {
  auto panel = ap::parse_panel_file("/nonexistent/dir/panel.xml", "L1");
  ASSERT_FALSE(panel.has_value());
  EXPECT_EQ(panel.error().kind, ac::ParseErrorKind::ReadFailed);
  EXPECT_EQ(panel.error().source, "/nonexistent/dir/panel.xml");
}
