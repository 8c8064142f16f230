#pragma once

#include <aoilog/core/date_time.hpp>
#include <pugixml.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace aoilog::parse {

/// Extractors never fail: absence or malformed content degrades to an empty value,
/// and the section interpreters decide whether that is an error.

/// Tag name without namespace prefix.
[[nodiscard]] std::string_view local_name(const pugi::xml_node& node) noexcept;

/// First child element with the given local name; empty node if none.
[[nodiscard]] pugi::xml_node find_child(const pugi::xml_node& parent, std::string_view name);

/// Number of element children (text, comments and PIs are not counted).
[[nodiscard]] std::size_t element_count(const pugi::xml_node& parent);

/// Text content of the named child; "" if the child is missing or has no text.
[[nodiscard]] std::string child_text(const pugi::xml_node& parent, std::string_view name);

/// Text of parent/outer/inner; "" if any step is missing.
[[nodiscard]] std::string nested_text(const pugi::xml_node& parent,
                                      std::string_view outer,
                                      std::string_view inner);

/// Date/End + Time/End of a GlobalInformation sub-section, parsed as "YYYYMMDD HHMMSS".
/// nullopt when either part is absent, empty or not a valid timestamp.
[[nodiscard]] std::optional<core::DateTime> nested_date_time(const pugi::xml_node& section);

/// "U5-2" -> "U5". Ids without '-' are returned unchanged.
[[nodiscard]] std::string strip_window_suffix(std::string_view win_id);

}  // namespace aoilog::parse
