#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace aoilog::app {

/// Uploader configuration: SQL server identity and AOI log location.
struct UploaderConfig {
  // [JVSERVER]
  std::string server;
  std::string database;
  std::string username;
  std::string password;

  // [AOI]
  std::string log_dir;
  std::string line;
  std::size_t chunk_size{10};            // panels per INSERT statement
  std::uint64_t delta_t_seconds{0};      // rescan window before the checkpoint
  std::string checkpoint_path{"last_date.txt"};
  std::size_t workers{0};                // 0 = hardware concurrency
};

enum class ConfigError {
  None = 0,
  FileNotFound,
  MissingServerSection,
  MissingServerField,
  MissingLineSection,
  MissingLineField,
};

/// Load an INI file with [JVSERVER] and [AOI] sections (KEY=VALUE, '#' or ';' comments).
/// SERVER, USERNAME, PASSWORD, DATABASE, DIR and LINE are mandatory.
[[nodiscard]] std::expected<UploaderConfig, ConfigError> load_config(const std::string& path);

/// Defaults when no file is provided.
UploaderConfig default_config();

/// Worker count from a command line or config value: unsigned decimal, the whole string.
[[nodiscard]] std::optional<std::size_t> parse_worker_count(std::string_view text);

[[nodiscard]] const char* to_string(ConfigError error) noexcept;

}  // namespace aoilog::app
