#pragma once

#include <aoilog/core/error.hpp>
#include <aoilog/core/panel.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace aoilog::app {

/// Callback for each parsed panel; may be invoked from worker threads.
/// Must be thread-safe if using parse_logs_batch_parallel.
using PanelCallback =
    std::function<void(const std::filesystem::path&, const aoilog::core::Panel&)>;

/// Callback for each rejected document; same threading rules as PanelCallback.
using FailureCallback =
    std::function<void(const std::filesystem::path&, const aoilog::core::ParseError&)>;

/// Outcome counts of one batch.
struct BatchSummary {
  std::size_t parsed{0};
  std::size_t failed{0};

  [[nodiscard]] bool all_ok() const noexcept { return failed == 0; }
};

/// Parses files sequentially; calls on_panel or on_failure for each (either may be empty).
BatchSummary parse_logs_batch(const std::vector<std::filesystem::path>& files,
                              const std::string& line_name,
                              PanelCallback on_panel,
                              FailureCallback on_failure = nullptr);

/// Parses files in parallel using a thread pool. Callbacks may be invoked
/// from any worker (must be thread-safe). num_workers 0 = use hardware concurrency.
BatchSummary parse_logs_batch_parallel(const std::vector<std::filesystem::path>& files,
                                       const std::string& line_name,
                                       PanelCallback on_panel,
                                       FailureCallback on_failure = nullptr,
                                       std::size_t num_workers = 0);

}  // namespace aoilog::app
