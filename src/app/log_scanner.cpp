#include <aoilog/app/log_scanner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <string>
#include <string_view>

namespace aoilog::app {

namespace {

bool ends_with(const std::string& s, const char* suffix) {
  const std::string_view sv(suffix);
  return s.size() >= sv.size() && s.compare(s.size() - sv.size(), sv.size(), sv) == 0;
}

std::string day_folder_name(const std::chrono::year_month_day& ymd) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d_%02u_%02u", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
  return buf;
}

}  // namespace

std::vector<std::filesystem::path> day_directories(const std::filesystem::path& log_dir,
                                                   const core::DateTime& since,
                                                   const core::DateTime& until) {
  using namespace std::chrono;
  std::vector<std::filesystem::path> out;

  sys_days current{year{since.year} / month{since.month} / day{since.day}};
  const sys_days last{year{until.year} / month{until.month} / day{until.day}};
  for (; current <= last; current += days{1}) {
    const std::filesystem::path dir = log_dir / day_folder_name(year_month_day{current});
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
      spdlog::debug("subdir exists: {}", dir.string());
      out.push_back(dir);
    }
  }
  return out;
}

bool is_log_file(const std::filesystem::path& path) {
  const std::string ext = path.extension().string();
  if (ext != ".xml" && ext != ".XML") return false;
  const std::string stem = path.stem().string();
  return !(ends_with(stem, "_AOI") || ends_with(stem, "_AXI"));
}

std::expected<std::vector<std::filesystem::path>, std::error_code> collect_logs(
    const std::vector<std::filesystem::path>& dirs,
    std::chrono::system_clock::time_point since) {
  std::vector<std::filesystem::path> out;
  for (const auto& dir : dirs) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) return std::unexpected(ec);

    const std::filesystem::directory_iterator end;
    while (it != end) {
      const std::filesystem::directory_entry& entry = *it;
      std::error_code entry_ec;
      const auto& path = entry.path();
      if (entry.is_regular_file(entry_ec) && !entry_ec && is_log_file(path)) {
        const auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec) {
          spdlog::warn("Could not read modification time of {}: {}", path.string(),
                       entry_ec.message());
        } else if (std::chrono::file_clock::to_sys(mtime) >= since) {
          out.push_back(path);
        }
      }

      it.increment(ec);
      if (ec) return std::unexpected(ec);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace aoilog::app
