#pragma once

#include <aoilog/core/date_time.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <system_error>
#include <vector>

namespace aoilog::app {

/// Stations write their logs into one folder per day, named YYYY_MM_DD.
/// Returns the existing day folders under log_dir for since..until (inclusive, by date).
[[nodiscard]] std::vector<std::filesystem::path> day_directories(
    const std::filesystem::path& log_dir,
    const core::DateTime& since,
    const core::DateTime& until);

/// XML logs (.xml / .XML) in dirs modified at or after since, sorted by path.
/// Stems ending in _AOI or _AXI are the stations' temporary files and are skipped.
[[nodiscard]] std::expected<std::vector<std::filesystem::path>, std::error_code> collect_logs(
    const std::vector<std::filesystem::path>& dirs,
    std::chrono::system_clock::time_point since);

/// True for a finished station log file name.
[[nodiscard]] bool is_log_file(const std::filesystem::path& path);

}  // namespace aoilog::app
