/**
 * aoilog-cli: parse AOI/AXI/repair inspection logs into panels; emit upload SQL.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/aoilog_cli --input panel.xml --line L1
 *        ./build/aoilog_cli --config config.ini [--sql out.sql] [--update-checkpoint]
 * Log level: SPDLOG_LEVEL=debug or --verbose.
 */

#include <aoilog/app/batch_runner.hpp>
#include <aoilog/app/checkpoint.hpp>
#include <aoilog/app/config.hpp>
#include <aoilog/app/log_scanner.hpp>
#include <aoilog/app/upload_batch.hpp>
#include <aoilog/core/date_time.hpp>
#include <aoilog/core/error.hpp>
#include <aoilog/core/panel.hpp>
#include <aoilog/parse/panel_builder.hpp>
#ifdef AOILOG_HAS_TBB
#include <aoilog/app/batch_runner_tbb.hpp>
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string join(const std::vector<std::string>& items) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    out += items[i];
  }
  return out;
}

std::string describe_panel(const aoilog::core::Panel& panel) {
  std::ostringstream out;
  out << "program=" << panel.program << " station=" << panel.station
      << " time=" << aoilog::core::format_date_time(panel.record_time())
      << " boards=" << panel.boards.size();
  if (!panel.operator_name.empty()) out << " operator=" << panel.operator_name;
  out << "\n";
  for (const auto& b : panel.boards) {
    out << "  #" << b.position << " " << b.serial << " " << b.result;
    if (!b.failures.empty()) out << " failed=[" << join(b.failures) << "]";
    if (!b.pseudo_failures.empty()) out << " pseudo=[" << join(b.pseudo_failures) << "]";
    out << "\n";
  }
  return out.str();
}

int run_single(const std::string& input_path, const std::string& line) {
  auto panel = aoilog::parse::parse_panel_file(input_path, line);
  if (!panel) {
    std::cerr << "Parse error: " << aoilog::core::describe(panel.error()) << "\n";
    return 1;
  }
  std::cout << describe_panel(*panel);
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::cfg::load_env_levels();

  std::string config_path;
  std::string input_path;
  std::string line_override;
  std::string since_override;
  std::string sql_path;
  std::size_t workers_override = 0;
  bool update_checkpoint = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--line" && i + 1 < argc) {
      line_override = argv[++i];
    } else if (arg == "--since" && i + 1 < argc) {
      since_override = argv[++i];
    } else if (arg == "--sql" && i + 1 < argc) {
      sql_path = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      const std::string value = argv[++i];
      const auto workers = aoilog::app::parse_worker_count(value);
      if (!workers) {
        std::cerr << "Invalid --workers " << value << "\n";
        return 1;
      }
      workers_override = *workers;
    } else if (arg == "--update-checkpoint") {
      update_checkpoint = true;
    } else if (arg == "--verbose" || arg == "-v") {
      spdlog::set_level(spdlog::level::debug);
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: aoilog_cli [options]\n"
                << "  --config <path>      config.ini with [JVSERVER] and [AOI] sections\n"
                << "  --input <path>       Parse one log file, or every log in a directory\n"
                << "  --line <name>        Production line (overrides [AOI] LINE)\n"
                << "  --since <timestamp>  'YYYY-MM-DD HH:MM:SS' (default: checkpoint - DELTA_T)\n"
                << "  --workers <n>        Parser threads (0 = hardware concurrency)\n"
                << "  --sql <path>         Write INSERT statements to file (default: stdout)\n"
                << "  --update-checkpoint  Advance the checkpoint if every log parsed\n"
                << "  --verbose            Debug logging (or SPDLOG_LEVEL=debug)\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  aoilog::app::UploaderConfig cfg = aoilog::app::default_config();
  if (!config_path.empty()) {
    auto loaded = aoilog::app::load_config(config_path);
    if (!loaded) {
      spdlog::error("Failed to load configuration {}: {}", config_path,
                    aoilog::app::to_string(loaded.error()));
      return 1;
    }
    cfg = std::move(*loaded);
  }
  if (!line_override.empty()) cfg.line = line_override;
  if (workers_override > 0) cfg.workers = workers_override;
  if (cfg.line.empty()) {
    std::cerr << "A production line is required (--line or [AOI] LINE)\n";
    return 1;
  }

  if (!input_path.empty() && std::filesystem::is_regular_file(input_path)) {
    return run_single(input_path, cfg.line);
  }

  const auto start_time = std::chrono::system_clock::now();
  std::vector<std::filesystem::path> logs;
  if (!input_path.empty()) {
    auto found = aoilog::app::collect_logs({input_path}, std::chrono::system_clock::time_point{});
    if (!found) {
      spdlog::error("Failed to gather logs in {}: {}", input_path, found.error().message());
      return 1;
    }
    logs = std::move(*found);
  } else {
    if (cfg.log_dir.empty()) {
      std::cerr << "Nothing to do: pass --input or a --config with [AOI] DIR\n";
      return 1;
    }
    aoilog::core::DateTime since;
    if (!since_override.empty()) {
      auto parsed = aoilog::core::parse_date_time(since_override);
      if (!parsed) {
        std::cerr << "Invalid --since " << since_override << "\n";
        return 1;
      }
      since = *parsed;
    } else {
      auto last = aoilog::app::read_checkpoint(cfg.checkpoint_path);
      if (!last) {
        spdlog::error("Failed to read last_date!");
        return 1;
      }
      since = aoilog::core::from_time_point(aoilog::core::to_time_point(*last) -
                                            std::chrono::seconds(cfg.delta_t_seconds));
    }
    const auto dirs = aoilog::app::day_directories(cfg.log_dir, since,
                                                   aoilog::core::from_time_point(start_time));
    auto found = aoilog::app::collect_logs(dirs, aoilog::core::to_time_point(since));
    if (!found) {
      spdlog::error("Failed to gather logs: {}", found.error().message());
      return 1;
    }
    logs = std::move(*found);
  }
  spdlog::info("{} log file(s) to process", logs.size());

  std::vector<aoilog::core::Panel> panels;
  std::mutex panels_mutex;
  auto on_panel = [&](const std::filesystem::path&, const aoilog::core::Panel& panel) {
    std::lock_guard lock(panels_mutex);
    panels.push_back(panel);
  };
  auto on_failure = [](const std::filesystem::path& file, const aoilog::core::ParseError&) {
    spdlog::error("Failed to process log: {}", file.string());
  };

#ifdef AOILOG_HAS_TBB
  const auto summary = cfg.workers == 1
                           ? aoilog::app::parse_logs_batch(logs, cfg.line, on_panel, on_failure)
                           : aoilog::app::parse_logs_batch_tbb(logs, cfg.line, on_panel, on_failure,
                                                                cfg.workers);
#else
  const auto summary =
      aoilog::app::parse_logs_batch_parallel(logs, cfg.line, on_panel, on_failure, cfg.workers);
#endif
  spdlog::info("Parsed {} panel(s), {} failure(s)", summary.parsed, summary.failed);

  std::ostringstream sql;
  if (!cfg.database.empty()) sql << aoilog::app::use_database_statement(cfg.database) << ";\n";
  for (const auto& stmt : aoilog::app::build_insert_statements(panels, cfg.chunk_size)) {
    sql << stmt << ";\n";
  }

  if (sql_path.empty()) {
    std::cout << sql.str();
  } else {
    std::ofstream f(sql_path);
    if (!f) {
      spdlog::error("Could not write {}", sql_path);
      return 1;
    }
    f << sql.str();
  }

  if (update_checkpoint) {
    if (!summary.all_ok()) {
      spdlog::error("Some logs failed - not setting new last_date");
      return 2;
    }
    if (!aoilog::app::write_checkpoint(cfg.checkpoint_path,
                                       aoilog::core::from_time_point(start_time))) {
      return 1;
    }
  }
  return summary.all_ok() ? 0 : 2;
}
