#pragma once

#include <aoilog/core/date_time.hpp>
#include <expected>
#include <filesystem>

namespace aoilog::app {

enum class CheckpointError {
  NotFound,
  Malformed,
};

/// Read the last successful run time ("YYYY-MM-DD HH:MM:SS", local time).
[[nodiscard]] std::expected<core::DateTime, CheckpointError> read_checkpoint(
    const std::filesystem::path& path);

/// Overwrite the checkpoint. Returns false if the file could not be written.
[[nodiscard]] bool write_checkpoint(const std::filesystem::path& path, const core::DateTime& when);

}  // namespace aoilog::app
