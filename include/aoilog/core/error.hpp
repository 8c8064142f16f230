#pragma once

#include <string>
#include <string_view>

namespace aoilog::core {

/// Why a document was rejected. Every kind is terminal for that document;
/// the caller logs it and moves on to the next file.
enum class ParseErrorKind {
  MissingSection,
  MissingField,
  InvalidTimestamp,
  UnparsableNumber,
  BoardOutOfRange,
  InconsistentBoard,
  ReadFailed,
  MalformedXml,
};

/// Typed parse failure with enough context to log and skip the document.
struct ParseError {
  ParseErrorKind kind{ParseErrorKind::MalformedXml};
  std::string source;   // file path or caller-supplied document id
  std::string section;  // e.g. "GlobalInformation"
  std::string field;    // e.g. "PCBNumber"
  std::string detail;
};

[[nodiscard]] std::string_view to_string(ParseErrorKind kind) noexcept;

/// One-line description, e.g. "missing-mandatory-field in PCBInformation/Barcode: ...".
[[nodiscard]] std::string describe(const ParseError& error);

}  // namespace aoilog::core
