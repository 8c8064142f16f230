#include <aoilog/app/checkpoint.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <string>

namespace aoilog::app {

std::expected<core::DateTime, CheckpointError> read_checkpoint(const std::filesystem::path& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::error("Error reading {}!", path.string());
    return std::unexpected(CheckpointError::NotFound);
  }
  std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  const auto start = text.find_first_not_of(" \t\r\n");
  const auto end = text.find_last_not_of(" \t\r\n");
  text = start == std::string::npos ? std::string() : text.substr(start, end - start + 1);
  spdlog::debug("Last date: {}", text);

  auto parsed = core::parse_date_time(text);
  if (!parsed) {
    spdlog::error("Error converting last date '{}'", text);
    return std::unexpected(CheckpointError::Malformed);
  }
  return *parsed;
}

bool write_checkpoint(const std::filesystem::path& path, const core::DateTime& when) {
  std::ofstream f(path, std::ios::trunc);
  if (!f) {
    spdlog::error("Could not write checkpoint {}", path.string());
    return false;
  }
  f << core::format_date_time(when);
  return static_cast<bool>(f);
}

}  // namespace aoilog::app
