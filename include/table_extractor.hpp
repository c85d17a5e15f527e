#pragma once

#include "table_config.hpp"
#include "table_data.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// One cell as handed over by the document front end.
struct RawCell {
  std::string text;
  std::optional<CellFormatting> formatting;

  RawCell() = default;
  RawCell(const char* t) : text(t) {}
  RawCell(std::string t) : text(std::move(t)) {}
  RawCell(std::string t, CellFormatting fmt) : text(std::move(t)), formatting(std::move(fmt)) {}
};

// Rows may differ in length.
using RawGrid = std::vector<std::vector<RawCell>>;

// A table could not be built from its source. Callers are expected to substitute
// a placeholder for the table and carry on with the rest of the document.
class TableExtractionError : public std::runtime_error {
public:
  explicit TableExtractionError(const std::string& what) : std::runtime_error(what) {}
};

// Builds a TableData from the raw grid and runs it through processTable.
// Throws TableExtractionError only when the table cannot be materialized at all.
TableData extractTable(const RawGrid& grid, const TableExtractionConfig& config);

std::vector<TableData> extractTables(const std::vector<RawGrid>& grids,
                                     const TableExtractionConfig& config);

// Statistics, header detection, merge handling and empty-cell filtering, in that order.
void processTable(TableData& table, const TableExtractionConfig& config);

// Drops empty cells from every row and recomputes the column count.
void filterEmptyCells(TableData& table);
