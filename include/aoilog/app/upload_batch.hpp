#pragma once

#include <aoilog/core/panel.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace aoilog::app {

/// Target table of the results database.
inline constexpr const char* kResultsTable = "[dbo].[SMT_AOI_RESULTS]";

/// One INSERT statement per chunk of chunk_size panels, one VALUES row per board.
/// Columns: Serial_NMBR, Board_NMBR, Program, Station, Operator, Result, Date_Time,
/// Failed, Pseudo_error. Chunks without boards produce no statement.
[[nodiscard]] std::vector<std::string> build_insert_statements(
    const std::vector<aoilog::core::Panel>& panels,
    std::size_t chunk_size);

/// "USE [database]"
[[nodiscard]] std::string use_database_statement(std::string_view database);

/// Single-quoted SQL string literal with embedded quotes doubled.
[[nodiscard]] std::string sql_quote(std::string_view value);

}  // namespace aoilog::app
