#include <aoilog/app/batch_runner.hpp>
#include <aoilog/parse/panel_builder.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace aoilog::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

// Returns true when the file parsed.
bool parse_one(const std::filesystem::path& file,
               const std::string& line_name,
               const PanelCallback& on_panel,
               const FailureCallback& on_failure) {
  auto panel = aoilog::parse::parse_panel_file(file, line_name);
  if (!panel) {
    if (on_failure) on_failure(file, panel.error());
    return false;
  }
  if (on_panel) on_panel(file, *panel);
  return true;
}

}  // namespace

BatchSummary parse_logs_batch(const std::vector<std::filesystem::path>& files,
                              const std::string& line_name,
                              PanelCallback on_panel,
                              FailureCallback on_failure) {
  BatchSummary summary;
  for (const auto& file : files) {
    if (parse_one(file, line_name, on_panel, on_failure)) {
      ++summary.parsed;
    } else {
      ++summary.failed;
    }
  }
  return summary;
}

BatchSummary parse_logs_batch_parallel(const std::vector<std::filesystem::path>& files,
                                       const std::string& line_name,
                                       PanelCallback on_panel,
                                       FailureCallback on_failure,
                                       std::size_t num_workers) {
  const std::size_t n = files.size();
  if (n == 0) return {};

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return parse_logs_batch(files, line_name, std::move(on_panel), std::move(on_failure));
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }

  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::atomic<bool> producer_done{false};
  std::atomic<std::size_t> parsed{0};
  std::atomic<std::size_t> failed{0};

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::unique_lock lock(queue_mutex);
        queue_cv.wait(lock, [&]() {
          return producer_done.load() || !index_queue.empty();
        });
        if (producer_done.load() && index_queue.empty()) break;
        if (index_queue.empty()) continue;
        idx = index_queue.front();
        index_queue.pop();
      }

      if (parse_one(files[idx], line_name, on_panel, on_failure)) {
        ++parsed;
      } else {
        ++failed;
      }
    }
  };

  producer_done = true;
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  queue_cv.notify_all();

  for (auto& t : threads) {
    t.join();
  }
  return BatchSummary{parsed.load(), failed.load()};
}

}  // namespace aoilog::app
