#include <aoilog/parse/global_information.hpp>
#include <gtest/gtest.h>
#include <pugixml.hpp>

namespace ap = aoilog::parse;
namespace ac = aoilog::core;

namespace {

constexpr const char* kAoiGlobal = R"(<Panel>
  <GlobalInformation>
    <Program><InspectionPlanName>PLAN_A</InspectionPlanName></Program>
    <Inspection>
      <Date><End>20240310</End></Date>
      <Time><End>081500</End></Time>
    </Inspection>
  </GlobalInformation>
</Panel>)";

constexpr const char* kRepairGlobal = R"(<Panel>
  <GlobalInformation>
    <Program><InspectionPlanName>PLAN_B</InspectionPlanName></Program>
    <Inspection>
      <Date><End>20240310</End></Date>
      <Time><End>081500</End></Time>
    </Inspection>
    <Repair>
      <OperatorName>kovacs</OperatorName>
      <Date><End>20240311</End></Date>
      <Time><End>140000</End></Time>
    </Repair>
  </GlobalInformation>
</Panel>)";

}  // namespace

TEST(GlobalInformation, MissingSection) {
  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_string("<Panel><PCBInformation/></Panel>"));
  auto info = ap::read_global_information(doc.document_element());
  ASSERT_FALSE(info.has_value());
  EXPECT_EQ(info.error().kind, ac::ParseErrorKind::MissingSection);
  EXPECT_EQ(info.error().section, "GlobalInformation");
}

TEST(GlobalInformation, AoiDocument) {
  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_string(kAoiGlobal));
  auto info = ap::read_global_information(doc.document_element());
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->program, "PLAN_A");
  EXPECT_EQ(info->kind, ac::DocumentKind::AoiAxi);
  EXPECT_TRUE(info->operator_name.empty());
  ASSERT_TRUE(info->inspection_time.has_value());
  EXPECT_EQ(*info->inspection_time, (ac::DateTime{2024, 3, 10, 8, 15, 0}));
  EXPECT_FALSE(info->repair_time.has_value());
  EXPECT_TRUE(ap::check_global_information(*info).has_value());
}

TEST(GlobalInformation, RepairDocumentUppercasesOperator) {
  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_string(kRepairGlobal));
  auto info = ap::read_global_information(doc.document_element());
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->kind, ac::DocumentKind::Repair);
  EXPECT_EQ(info->operator_name, "KOVACS");
  ASSERT_TRUE(info->repair_time.has_value());
  EXPECT_EQ(*info->repair_time, (ac::DateTime{2024, 3, 11, 14, 0, 0}));
  EXPECT_TRUE(ap::check_global_information(*info).has_value());
}

TEST(GlobalInformation, EmptyProgramRejected) {
  ap::GlobalInformation info;
  info.inspection_time = ac::DateTime{2024, 1, 1, 0, 0, 0};
  auto valid = ap::check_global_information(info);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().kind, ac::ParseErrorKind::MissingField);
}

TEST(GlobalInformation, MissingInspectionTimeRejected) {
  ap::GlobalInformation info;
  info.program = "P";
  auto valid = ap::check_global_information(info);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().kind, ac::ParseErrorKind::InvalidTimestamp);
  EXPECT_EQ(valid.error().field, "Inspection");
}

TEST(GlobalInformation, InspectionBefore2000Rejected) {
  ap::GlobalInformation info;
  info.program = "P";
  info.inspection_time = ac::DateTime{1999, 12, 31, 23, 59, 59};
  auto valid = ap::check_global_information(info);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().kind, ac::ParseErrorKind::InvalidTimestamp);
}

TEST(GlobalInformation, RepairWithoutRepairTimeRejected) {
  ap::GlobalInformation info;
  info.program = "P";
  info.kind = ac::DocumentKind::Repair;
  info.inspection_time = ac::DateTime{2024, 1, 1, 0, 0, 0};
  auto valid = ap::check_global_information(info);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().kind, ac::ParseErrorKind::InvalidTimestamp);
  EXPECT_EQ(valid.error().field, "Repair");
}

TEST(GlobalInformation, OperatorUppercasedBeyondAscii) {
  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_string(R"(<Panel><GlobalInformation>
      <Program><InspectionPlanName>P</InspectionPlanName></Program>
      <Repair>
        <OperatorName>kovács éva</OperatorName>
        <Date><End>20240311</End></Date>
        <Time><End>140000</End></Time>
      </Repair>
    </GlobalInformation></Panel>)"));
  auto info = ap::read_global_information(doc.document_element());
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->operator_name, "KOVÁCS ÉVA");
}
