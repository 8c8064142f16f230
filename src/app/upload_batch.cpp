#include <aoilog/app/upload_batch.hpp>
#include <aoilog/core/date_time.hpp>
#include <algorithm>

namespace aoilog::app {

namespace {

std::string join(const std::vector<std::string>& items, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += sep;
    out += items[i];
  }
  return out;
}

std::string board_row(const aoilog::core::Panel& panel, const aoilog::core::Board& board) {
  std::string row = "(";
  row += sql_quote(board.serial) + ", ";
  row += sql_quote(std::to_string(board.position)) + ", ";
  row += sql_quote(panel.program) + ", ";
  row += sql_quote(panel.station) + ", ";
  row += sql_quote(panel.operator_name) + ", ";
  row += sql_quote(board.result) + ", ";
  row += sql_quote(aoilog::core::format_date_time(panel.record_time())) + ", ";
  row += sql_quote(join(board.failures, ", ")) + ", ";
  row += sql_quote(join(board.pseudo_failures, ", "));
  row += ')';
  return row;
}

}  // namespace

std::string sql_quote(std::string_view value) {
  std::string out = "'";
  for (const char c : value) {
    if (c == '\'') out += '\'';
    out += c;
  }
  out += '\'';
  return out;
}

std::string use_database_statement(std::string_view database) {
  return "USE [" + std::string(database) + "]";
}

std::vector<std::string> build_insert_statements(const std::vector<aoilog::core::Panel>& panels,
                                                 std::size_t chunk_size) {
  std::vector<std::string> out;
  if (chunk_size == 0) chunk_size = 1;

  for (std::size_t begin = 0; begin < panels.size(); begin += chunk_size) {
    const std::size_t end = std::min(begin + chunk_size, panels.size());
    std::vector<std::string> rows;
    for (std::size_t i = begin; i < end; ++i) {
      for (const auto& board : panels[i].boards) {
        rows.push_back(board_row(panels[i], board));
      }
    }
    if (rows.empty()) continue;

    std::string stmt = "INSERT INTO ";
    stmt += kResultsTable;
    stmt +=
        " ([Serial_NMBR], [Board_NMBR], [Program], [Station], [Operator], [Result], "
        "[Date_Time], [Failed], [Pseudo_error]) VALUES ";
    stmt += join(rows, ", ");
    out.push_back(std::move(stmt));
  }
  return out;
}

}  // namespace aoilog::app
