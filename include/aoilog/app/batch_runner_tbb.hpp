#pragma once

#include <aoilog/app/batch_runner.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#ifdef AOILOG_HAS_TBB

namespace aoilog::app {

/// Parses files in parallel using TBB.
///
/// Each file is parsed independently; document order is not preserved in the callbacks.
/// \param files Log files to parse. Read only.
/// \param line_name Production line used to derive each panel's station name.
/// \param on_panel Invoked for each parsed panel. Must be thread-safe.
/// \param on_failure Invoked for each rejected file. Must be thread-safe.
/// \param max_concurrency Upper bound on worker threads; 0 uses the TBB default.
BatchSummary parse_logs_batch_tbb(const std::vector<std::filesystem::path>& files,
                                  const std::string& line_name,
                                  PanelCallback on_panel,
                                  FailureCallback on_failure = nullptr,
                                  std::size_t max_concurrency = 0);

}  // namespace aoilog::app

#endif  // AOILOG_HAS_TBB
