#include <aoilog/core/error.hpp>

namespace aoilog::core {

std::string_view to_string(ParseErrorKind kind) noexcept {
  switch (kind) {
    case ParseErrorKind::MissingSection:
      return "missing-mandatory-section";
    case ParseErrorKind::MissingField:
      return "missing-mandatory-field";
    case ParseErrorKind::InvalidTimestamp:
      return "invalid-timestamp-combination";
    case ParseErrorKind::UnparsableNumber:
      return "unparsable-numeric-reference";
    case ParseErrorKind::BoardOutOfRange:
      return "out-of-range-board-reference";
    case ParseErrorKind::InconsistentBoard:
      return "inconsistent-board-record";
    case ParseErrorKind::ReadFailed:
      return "read-failed";
    case ParseErrorKind::MalformedXml:
      return "malformed-xml";
  }
  return "unknown";
}

std::string describe(const ParseError& error) {
  std::string out(to_string(error.kind));
  if (!error.section.empty()) {
    out += " in ";
    out += error.section;
    if (!error.field.empty()) {
      out += '/';
      out += error.field;
    }
  } else if (!error.field.empty()) {
    out += " in ";
    out += error.field;
  }
  if (!error.detail.empty()) {
    out += ": ";
    out += error.detail;
  }
  if (!error.source.empty()) {
    out += " (";
    out += error.source;
    out += ')';
  }
  return out;
}

}  // namespace aoilog::core
