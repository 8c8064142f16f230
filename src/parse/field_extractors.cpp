#include <aoilog/parse/field_extractors.hpp>
#include <spdlog/spdlog.h>

namespace aoilog::parse {

std::string_view local_name(const pugi::xml_node& node) noexcept {
  const std::string_view full = node.name();
  const auto colon = full.rfind(':');
  return colon == std::string_view::npos ? full : full.substr(colon + 1);
}

pugi::xml_node find_child(const pugi::xml_node& parent, std::string_view name) {
  for (pugi::xml_node c = parent.first_child(); c; c = c.next_sibling()) {
    if (c.type() == pugi::node_element && local_name(c) == name) return c;
  }
  return pugi::xml_node();
}

std::size_t element_count(const pugi::xml_node& parent) {
  std::size_t n = 0;
  for (pugi::xml_node c = parent.first_child(); c; c = c.next_sibling()) {
    if (c.type() == pugi::node_element) ++n;
  }
  return n;
}

std::string child_text(const pugi::xml_node& parent, std::string_view name) {
  const pugi::xml_node n = find_child(parent, name);
  return n ? std::string(n.text().get()) : std::string();
}

std::string nested_text(const pugi::xml_node& parent,
                        std::string_view outer,
                        std::string_view inner) {
  const pugi::xml_node n = find_child(parent, outer);
  return n ? child_text(n, inner) : std::string();
}

std::optional<core::DateTime> nested_date_time(const pugi::xml_node& section) {
  const std::string date = nested_text(section, "Date", "End");
  const std::string time = nested_text(section, "Time", "End");
  if (date.empty() || time.empty()) return std::nullopt;

  spdlog::debug("Raw time string: {} {}", date, time);
  auto parsed = core::parse_compact_date_time(date, time);
  if (!parsed) {
    spdlog::warn("Unparsable timestamp '{} {}' in <{}>", date, time, local_name(section));
  }
  return parsed;
}

std::string strip_window_suffix(std::string_view win_id) {
  const auto dash = win_id.rfind('-');
  return std::string(dash == std::string_view::npos ? win_id : win_id.substr(0, dash));
}

}  // namespace aoilog::parse
