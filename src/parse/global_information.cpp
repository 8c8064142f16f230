#include <aoilog/parse/global_information.hpp>
#include <aoilog/parse/field_extractors.hpp>
#include <spdlog/spdlog.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace aoilog::parse {

namespace {

constexpr const char* kSection = "GlobalInformation";
constexpr int kMinYear = 2000;

// Full Unicode case mapping, independent of the process locale ("kovács" -> "KOVÁCS").
std::string to_upper(const std::string& s) {
  std::string out;
  icu::UnicodeString::fromUTF8(s).toUpper(icu::Locale::getRoot()).toUTF8String(out);
  return out;
}

bool plausible(const std::optional<core::DateTime>& dt) {
  return dt.has_value() && dt->year >= kMinYear;
}

core::ParseError timestamp_error(const char* field, const std::optional<core::DateTime>& dt) {
  return core::ParseError{core::ParseErrorKind::InvalidTimestamp, {}, kSection, field,
                          dt ? "year before 2000: " + core::format_date_time(*dt)
                             : std::string("timestamp missing or unparsable")};
}

}  // namespace

std::expected<GlobalInformation, core::ParseError> read_global_information(
    const pugi::xml_node& root) {
  const pugi::xml_node ginfo = find_child(root, kSection);
  if (!ginfo) {
    return std::unexpected(core::ParseError{core::ParseErrorKind::MissingSection, {}, kSection,
                                            {}, "Could not find <GlobalInformation>"});
  }

  GlobalInformation out;
  if (const pugi::xml_node program = find_child(ginfo, "Program")) {
    out.program = child_text(program, "InspectionPlanName");
    spdlog::debug("Program: {}", out.program);
  }
  if (const pugi::xml_node inspection = find_child(ginfo, "Inspection")) {
    out.inspection_time = nested_date_time(inspection);
  }
  if (const pugi::xml_node repair = find_child(ginfo, "Repair")) {
    out.kind = core::DocumentKind::Repair;
    out.operator_name = to_upper(child_text(repair, "OperatorName"));
    out.repair_time = nested_date_time(repair);
    spdlog::debug("OperatorName: {}", out.operator_name);
  }
  return out;
}

std::expected<void, core::ParseError> check_global_information(const GlobalInformation& info) {
  if (info.program.empty()) {
    return std::unexpected(core::ParseError{core::ParseErrorKind::MissingField, {}, kSection,
                                            "Program/InspectionPlanName", "program is empty"});
  }
  if (!plausible(info.inspection_time)) {
    return std::unexpected(timestamp_error("Inspection", info.inspection_time));
  }
  if (info.kind == core::DocumentKind::Repair && !plausible(info.repair_time)) {
    return std::unexpected(timestamp_error("Repair", info.repair_time));
  }
  return {};
}

}  // namespace aoilog::parse
