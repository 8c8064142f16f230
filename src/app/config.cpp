#include <aoilog/app/config.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <string_view>

namespace aoilog::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
T parse_number_or(const std::string& value, T fallback) {
  T v{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v);
  if (ec != std::errc() || ptr != value.data() + value.size()) return fallback;
  return v;
}

}  // namespace

std::optional<std::size_t> parse_worker_count(std::string_view text) {
  std::size_t v{};
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return v;
}

UploaderConfig default_config() {
  UploaderConfig c;
  c.chunk_size = 10;
  c.delta_t_seconds = 0;
  c.checkpoint_path = "last_date.txt";
  c.workers = 0;
  return c;
}

std::expected<UploaderConfig, ConfigError> load_config(const std::string& path) {
  UploaderConfig c = default_config();
  std::ifstream f(path);
  if (!f) return std::unexpected(ConfigError::FileNotFound);

  bool has_server = false;
  bool has_aoi = false;
  std::string section;
  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';') continue;
    if (line.front() == '[' && line.back() == ']') {
      section = line.substr(1, line.size() - 2);
      trim(section);
      if (section == "JVSERVER") has_server = true;
      else if (section == "AOI") has_aoi = true;
      continue;
    }
    if (!parse_line(line, key, value)) continue;

    if (section == "JVSERVER") {
      if (key == "SERVER") c.server = value;
      else if (key == "DATABASE") c.database = value;
      else if (key == "USERNAME") c.username = value;
      else if (key == "PASSWORD") c.password = value;
    } else if (section == "AOI") {
      if (key == "DIR") c.log_dir = value;
      else if (key == "LINE") c.line = value;
      else if (key == "CHUNKS") c.chunk_size = parse_number_or<std::size_t>(value, 10);
      else if (key == "DELTA_T") c.delta_t_seconds = parse_number_or<std::uint64_t>(value, 0);
      else if (key == "CHECKPOINT") c.checkpoint_path = value;
      else if (key == "WORKERS") c.workers = parse_number_or<std::size_t>(value, 0);
    }
  }
  if (c.chunk_size == 0) c.chunk_size = 10;

  if (!has_server) return std::unexpected(ConfigError::MissingServerSection);
  if (c.server.empty() || c.password.empty() || c.username.empty() || c.database.empty()) {
    return std::unexpected(ConfigError::MissingServerField);
  }
  if (!has_aoi) return std::unexpected(ConfigError::MissingLineSection);
  if (c.log_dir.empty() || c.line.empty()) return std::unexpected(ConfigError::MissingLineField);

  spdlog::debug("Config loaded from {}: line={}, dir={}, chunks={}, delta_t={}s", path, c.line,
                c.log_dir, c.chunk_size, c.delta_t_seconds);
  return c;
}

const char* to_string(ConfigError error) noexcept {
  switch (error) {
    case ConfigError::None:
      return "ok";
    case ConfigError::FileNotFound:
      return "could not read configuration file";
    case ConfigError::MissingServerSection:
      return "could not find [JVSERVER] section";
    case ConfigError::MissingServerField:
      return "missing [JVSERVER] fields";
    case ConfigError::MissingLineSection:
      return "could not find [AOI] section";
    case ConfigError::MissingLineField:
      return "missing [AOI] fields";
  }
  return "unknown";
}

}  // namespace aoilog::app
