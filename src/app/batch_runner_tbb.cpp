#include <aoilog/app/batch_runner_tbb.hpp>

#ifdef AOILOG_HAS_TBB

#include <aoilog/parse/panel_builder.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <atomic>
#include <cstddef>

namespace aoilog::app {

BatchSummary parse_logs_batch_tbb(const std::vector<std::filesystem::path>& files,
                                  const std::string& line_name,
                                  PanelCallback on_panel,
                                  FailureCallback on_failure,
                                  std::size_t max_concurrency) {
  if (files.empty()) return {};

  std::atomic<std::size_t> parsed{0};
  std::atomic<std::size_t> failed{0};
  auto body = [&] {
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, files.size()),
        [&](const tbb::blocked_range<std::size_t>& range) {
          for (std::size_t i = range.begin(); i != range.end(); ++i) {
            auto panel = aoilog::parse::parse_panel_file(files[i], line_name);
            if (panel) {
              ++parsed;
              if (on_panel) on_panel(files[i], *panel);
            } else {
              ++failed;
              if (on_failure) on_failure(files[i], panel.error());
            }
          }
        });
  };

  if (max_concurrency > 0) {
    tbb::task_arena arena(static_cast<int>(max_concurrency));
    arena.execute(body);
  } else {
    body();
  }
  return BatchSummary{parsed.load(), failed.load()};
}

}  // namespace aoilog::app

#endif  // AOILOG_HAS_TBB
